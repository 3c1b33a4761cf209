#include "common/Digest.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rwd::common {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

std::string toHex(const unsigned char* pData, size_t nLen) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < nLen; ++i) {
    oss << std::setw(2) << static_cast<int>(pData[i]);
  }
  return oss.str();
}

/// Owns an EVP_MD_CTX initialised for SHA-256.
class Sha256Context {
 public:
  Sha256Context() : _pCtx(EVP_MD_CTX_new()) {
    if (!_pCtx) {
      throw std::runtime_error("Failed to create digest context");
    }
    if (EVP_DigestInit_ex(_pCtx, EVP_sha256(), nullptr) != 1) {
      EVP_MD_CTX_free(_pCtx);
      throw std::runtime_error("SHA-256 digest initialisation failed");
    }
  }
  ~Sha256Context() { EVP_MD_CTX_free(_pCtx); }

  Sha256Context(const Sha256Context&) = delete;
  Sha256Context& operator=(const Sha256Context&) = delete;

  void update(const void* pData, size_t nLen) {
    if (EVP_DigestUpdate(_pCtx, pData, nLen) != 1) {
      throw std::runtime_error("SHA-256 hash computation failed");
    }
  }

  std::string finalHex() {
    unsigned char vHash[EVP_MAX_MD_SIZE];
    unsigned int uHashLen = 0;
    if (EVP_DigestFinal_ex(_pCtx, vHash, &uHashLen) != 1) {
      throw std::runtime_error("SHA-256 hash computation failed");
    }
    return toHex(vHash, uHashLen);
  }

 private:
  EVP_MD_CTX* _pCtx;
};

}  // namespace

// ── SHA-256 ────────────────────────────────────────────────────────────────

std::string Digest::sha256Hex(const std::string& sInput) {
  Sha256Context ctx;
  ctx.update(sInput.data(), sInput.size());
  return ctx.finalHex();
}

std::string Digest::sha256File(const std::filesystem::path& pathFile) {
  std::ifstream ifs(pathFile, std::ios::binary);
  if (!ifs.is_open()) {
    throw std::runtime_error("Cannot open file for hashing: " + pathFile.string());
  }

  Sha256Context ctx;
  std::vector<char> vBuf(kReadChunk);
  while (ifs) {
    ifs.read(vBuf.data(), static_cast<std::streamsize>(vBuf.size()));
    const auto nRead = ifs.gcount();
    if (nRead > 0) {
      ctx.update(vBuf.data(), static_cast<size_t>(nRead));
    }
  }
  if (ifs.bad()) {
    throw std::runtime_error("Read error while hashing: " + pathFile.string());
  }
  return ctx.finalHex();
}

// ── Random identifiers ─────────────────────────────────────────────────────

std::string Digest::randomHex(int iBytes) {
  if (iBytes <= 0) {
    throw std::invalid_argument("randomHex requires a positive byte count");
  }
  std::vector<unsigned char> vBytes(static_cast<size_t>(iBytes));
  if (RAND_bytes(vBytes.data(), iBytes) != 1) {
    throw std::runtime_error("Failed to generate random bytes");
  }
  return toHex(vBytes.data(), vBytes.size());
}

}  // namespace rwd::common
