// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_VERIFIER_HPP
#define LASTCHAIR_VERIFIER_HPP

#include "rules.hpp"

#include "proto/credential.pb.h"

#include <chairutil/uint256.hpp>

#include <string>

namespace lastchair
{

/** Number of public inputs at the end of a credential with the reveal.  */
constexpr int NUM_REVEALED_INPUTS = 1 + NUM_TRAPS;

/**
 * Extracts the revealed selection from the four trailing public inputs
 * of a credential.  Returns false if there are not enough inputs, or
 * they are not 32-byte scalars fitting into an unsigned.  The returned
 * selection is not checked for validity.
 */
bool ExtractRevealedSelection (const proto::RevealCredential& cred,
                               Selection& sel);

/**
 * Interface for checking reveal credentials against the commitment
 * a player made for a round.
 */
class RevealVerifier
{

public:

  RevealVerifier () = default;
  virtual ~RevealVerifier () = default;

  RevealVerifier (const RevealVerifier&) = delete;
  void operator= (const RevealVerifier&) = delete;

  /**
   * Verifies the credential as an opening of the given commitment.
   * Returns true if it is valid, in which case the selection the proof
   * attests to is returned in attested.
   */
  virtual bool Verify (const uint256& commitment,
                       const proto::RevealCredential& cred,
                       Selection& attested) const = 0;

};

/** Minimum and maximum length of the salt in a hash commitment.  */
constexpr size_t MIN_SALT_BYTES = 1;
constexpr size_t MAX_SALT_BYTES = 32;

/**
 * Computes the hash commitment for a selection and salt, which is
 * the SHA-256 of chair and traps (each as 32-byte scalar) followed
 * by the raw salt.
 */
uint256 ComputeCommitment (const Selection& sel, const std::string& salt);

/**
 * Computes the public hash binding a commitment to its revealed values,
 * i.e. the SHA-256 of the commitment, chair and traps.
 */
uint256 ComputePublicHash (const uint256& commitment, const Selection& sel);

/**
 * Constructs a credential that HashRevealVerifier accepts as opening of
 * ComputeCommitment (sel, salt).
 */
proto::RevealCredential BuildCredential (const Selection& sel,
                                         const std::string& salt);

/**
 * RevealVerifier for plain hash commitments.  The credential's proof is
 * the salt, and its public inputs are the public hash followed by the
 * chair and traps.
 */
class HashRevealVerifier : public RevealVerifier
{

public:

  HashRevealVerifier () = default;

  bool Verify (const uint256& commitment, const proto::RevealCredential& cred,
               Selection& attested) const override;

};

} // namespace lastchair

#endif // LASTCHAIR_VERIFIER_HPP
