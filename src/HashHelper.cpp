#include "HashHelper.hpp"

#include <openssl/hmac.h>

#include <stdexcept>

namespace http_pipeline {

Hash::Hash(const EVP_MD* md) : md_(md), ctx_(EVP_MD_CTX_new()) {
	if (!md_) {
		EVP_MD_CTX_free(ctx_);
		throw std::invalid_argument("Digest: null EVP_MD");
	}
	if (!ctx_) throw std::runtime_error("Digest: EVP_MD_CTX_new failed");
	if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1) {
		EVP_MD_CTX_free(ctx_);
		throw std::runtime_error("Digest: EVP_DigestInit_ex failed");
	}
}

Hash::~Hash() {
	if (this->ctx_) EVP_MD_CTX_free(this->ctx_);
}

#define HASH_DEFINE(name, evp_func) \
	Hash Hash::name() { return Hash(evp_func()); } \
	std::string Hash::name(std::string_view data) { \
		Hash hash(evp_func()); \
		return hash.update(data).final(); \
	}

HASH_ALGORITHMS(HASH_DEFINE)

#undef HASH_DEFINE

Hash& Hash::update(std::string_view data) {
	if (this->finalized_)
		throw std::logic_error("Digest: update after final");
	if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1)
		throw std::runtime_error("Digest: EVP_DigestUpdate failed");
	return *this;
}

std::string Hash::final() {
	if (!this->finalized_) {
		this->finalized_ = true;

		unsigned int out_len = 0;
		this->result_.resize(EVP_MAX_MD_SIZE);
		if (EVP_DigestFinal_ex(ctx_, reinterpret_cast<unsigned char*>(this->result_.data()), &out_len) != 1)
			throw std::runtime_error("Digest: EVP_DigestFinal_ex failed");

		this->result_.resize(out_len);
	}
	return this->result_;
}

std::string Hash::hexdigest(std::string_view binary) {
	static const char hex_chars[] = "0123456789abcdef";
	std::string hex;
	hex.reserve(binary.size() * 2);
	for (unsigned char c : binary) {
		hex += hex_chars[(c >> 4) & 0x0F];
		hex += hex_chars[c & 0x0F];
	}
	return hex;
}

#define HMAC_DEFINE(name, evp_func) \
	std::string Hmac::name(std::string_view key, std::string_view data) { \
		return compute(evp_func(), key, data); \
	}

HASH_ALGORITHMS(HMAC_DEFINE)

#undef HMAC_DEFINE

std::string Hmac::compute(const EVP_MD* md, std::string_view key, std::string_view data) {
	std::string out(EVP_MAX_MD_SIZE, '\0');
	unsigned int out_len = 0;

	if (!HMAC(md, key.data(), static_cast<int>(key.size()),
			reinterpret_cast<const unsigned char*>(data.data()), data.size(),
			reinterpret_cast<unsigned char*>(out.data()), &out_len))
		throw std::runtime_error("Hmac: HMAC failed");

	out.resize(out_len);
	return out;
}

namespace base64 {

std::string encode(std::string_view binary) {
	if (binary.empty()) return {};

	// 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
	std::string out(4 * ((binary.size() + 2) / 3) + 1, '\0');
	int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
		reinterpret_cast<const unsigned char*>(binary.data()), static_cast<int>(binary.size()));
	if (written < 0)
		throw std::runtime_error("base64: EVP_EncodeBlock failed");

	out.resize(static_cast<size_t>(written));
	return out;
}

} // namespace base64

} // namespace http_pipeline
