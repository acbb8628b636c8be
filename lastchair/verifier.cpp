// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "verifier.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

#include <limits>

namespace lastchair
{

namespace
{

/**
 * Simple RAII wrapper around an OpenSSL SHA-256 digest context.
 */
class Sha256Hasher
{

private:

  /** The underlying OpenSSL context.  */
  EVP_MD_CTX* ctx;

public:

  Sha256Hasher ()
    : ctx(EVP_MD_CTX_new ())
  {
    CHECK (ctx != nullptr);
    CHECK_EQ (EVP_DigestInit_ex (ctx, EVP_sha256 (), nullptr), 1);
  }

  ~Sha256Hasher ()
  {
    EVP_MD_CTX_free (ctx);
  }

  Sha256Hasher (const Sha256Hasher&) = delete;
  void operator= (const Sha256Hasher&) = delete;

  Sha256Hasher&
  operator<< (const std::string& data)
  {
    CHECK_EQ (EVP_DigestUpdate (ctx, data.data (), data.size ()), 1);
    return *this;
  }

  Sha256Hasher&
  operator<< (const uint256& val)
  {
    CHECK_EQ (EVP_DigestUpdate (ctx, val.GetBlob (), uint256::NUM_BYTES), 1);
    return *this;
  }

  uint256
  Finalise ()
  {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned outlen;
    CHECK_EQ (EVP_DigestFinal_ex (ctx, out, &outlen), 1);
    CHECK_EQ (outlen, uint256::NUM_BYTES);

    uint256 res;
    res.FromBlob (out);
    return res;
  }

};

uint256
ScalarValue (const unsigned val)
{
  uint256 res;
  res.FromScalar (val);
  return res;
}

/**
 * Adds the chair and traps of a selection as scalars to the hasher.
 */
void
HashSelection (Sha256Hasher& hasher, const Selection& sel)
{
  hasher << ScalarValue (sel.chair);
  for (const unsigned t : sel.traps)
    hasher << ScalarValue (t);
}

/**
 * Parses a public input as scalar fitting into an unsigned.
 */
bool
ParseScalarInput (const std::string& data, unsigned& val)
{
  uint256 scalar;
  if (!scalar.FromBinaryString (data))
    return false;

  uint64_t full;
  if (!scalar.ToScalar (full))
    return false;
  if (full > std::numeric_limits<unsigned>::max ())
    return false;

  val = full;
  return true;
}

} // anonymous namespace

bool
ExtractRevealedSelection (const proto::RevealCredential& cred, Selection& sel)
{
  const int num = cred.public_inputs_size ();
  if (num < NUM_REVEALED_INPUTS)
    {
      LOG (WARNING)
          << "Credential has only " << num << " public inputs";
      return false;
    }

  const int start = num - NUM_REVEALED_INPUTS;
  Selection res;
  if (!ParseScalarInput (cred.public_inputs (start), res.chair))
    return false;
  for (unsigned i = 0; i < NUM_TRAPS; ++i)
    if (!ParseScalarInput (cred.public_inputs (start + 1 + i), res.traps[i]))
      return false;

  sel = res;
  return true;
}

uint256
ComputeCommitment (const Selection& sel, const std::string& salt)
{
  CHECK_GE (salt.size (), MIN_SALT_BYTES);
  CHECK_LE (salt.size (), MAX_SALT_BYTES);

  Sha256Hasher hasher;
  HashSelection (hasher, sel);
  hasher << salt;

  return hasher.Finalise ();
}

uint256
ComputePublicHash (const uint256& commitment, const Selection& sel)
{
  Sha256Hasher hasher;
  hasher << commitment;
  HashSelection (hasher, sel);

  return hasher.Finalise ();
}

proto::RevealCredential
BuildCredential (const Selection& sel, const std::string& salt)
{
  const uint256 commitment = ComputeCommitment (sel, salt);

  proto::RevealCredential res;
  res.set_proof (salt);
  res.add_public_inputs (ComputePublicHash (commitment, sel).GetBinaryString ());
  res.add_public_inputs (ScalarValue (sel.chair).GetBinaryString ());
  for (const unsigned t : sel.traps)
    res.add_public_inputs (ScalarValue (t).GetBinaryString ());

  return res;
}

bool
HashRevealVerifier::Verify (const uint256& commitment,
                            const proto::RevealCredential& cred,
                            Selection& attested) const
{
  if (cred.public_inputs_size () != 1 + NUM_REVEALED_INPUTS)
    {
      LOG (WARNING)
          << "Hash credential has " << cred.public_inputs_size ()
          << " public inputs";
      return false;
    }

  const std::string& salt = cred.proof ();
  if (salt.size () < MIN_SALT_BYTES || salt.size () > MAX_SALT_BYTES)
    {
      LOG (WARNING) << "Invalid salt length: " << salt.size ();
      return false;
    }

  uint256 publicHash;
  if (!publicHash.FromBinaryString (cred.public_inputs (0)))
    {
      LOG (WARNING) << "Public hash input is not 32 bytes";
      return false;
    }

  Selection sel;
  if (!ExtractRevealedSelection (cred, sel))
    return false;

  if (ComputeCommitment (sel, salt) != commitment)
    {
      LOG (WARNING) << "Selection and salt do not match the commitment";
      return false;
    }

  if (ComputePublicHash (commitment, sel) != publicHash)
    {
      LOG (WARNING) << "Public hash does not match the revealed values";
      return false;
    }

  attested = sel;
  return true;
}

} // namespace lastchair
