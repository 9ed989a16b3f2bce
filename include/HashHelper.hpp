#pragma once

#include <string>
#include <string_view>
#ifdef __cplusplus
extern "C" {
#endif
#include <openssl/evp.h>
#ifdef __cplusplus
}
#endif

namespace http_pipeline {

// Digests available for body hashing and request signing
#define HASH_ALGORITHMS(HASH_ALGORITHM) \
	HASH_ALGORITHM(sha1, EVP_sha1) \
	HASH_ALGORITHM(sha256, EVP_sha256) \
	HASH_ALGORITHM(sha512, EVP_sha512)

/**
 * Incremental message digest over an EVP_MD.
 * NOT THREAD-SAFE, one instance per thread.
 */
class Hash {
public:
	explicit Hash(const EVP_MD* md);
	~Hash();

#define HASH_DECLARE(name, evp_func) \
	static Hash name(); \
	static std::string name(std::string_view data);

	HASH_ALGORITHMS(HASH_DECLARE)

#undef HASH_DECLARE

	Hash(const Hash&) = delete;
	Hash& operator=(const Hash&) = delete;

	Hash& update(std::string_view data);

	// Binary digest. Idempotent
	std::string final();

	static std::string hexdigest(std::string_view binary);

private:
	const EVP_MD* md_ = nullptr;
	EVP_MD_CTX* ctx_ = nullptr;
	bool finalized_ = false;
	std::string result_;
};

/**
 * One-shot keyed digest.
 */
class Hmac {
public:
#define HMAC_DECLARE(name, evp_func) \
	static std::string name(std::string_view key, std::string_view data);

	HASH_ALGORITHMS(HMAC_DECLARE)

#undef HMAC_DECLARE

private:
	static std::string compute(const EVP_MD* md, std::string_view key, std::string_view data);
};

namespace base64 {

std::string encode(std::string_view binary);

} // namespace base64

} // namespace http_pipeline
