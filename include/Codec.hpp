#pragma once

#include "HttpError.hpp"
#include "Status.hpp"
#include "models.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>

namespace http_pipeline {

/**
 * Converts a document tree to wire bytes and back, for one MIME type.
 * Implementations must be stateless: one instance is shared by all calls of a client.
 */
class Codec {
public:
	virtual ~Codec() = default;

	virtual MimeType mimeType() const = 0;
	virtual std::string encode(const Json::Value& document) const = 0;
	virtual Json::Value decode(std::string_view bytes) const = 0;
};

class JsonCodec : public Codec {
public:
	// indentation "" writes compact JSON
	explicit JsonCodec(std::string indentation = "");

	MimeType mimeType() const override { return MimeType::json(); }
	std::string encode(const Json::Value& document) const override;
	Json::Value decode(std::string_view bytes) const override;

private:
	std::string indentation_;
};

/**
 * MIME type -> codec. Lookups ignore case and MIME parameters.
 */
class CodecRegistry {
public:
	CodecRegistry() = default;

	// application/json -> JsonCodec
	static CodecRegistry withDefaults();

	CodecRegistry& add(std::shared_ptr<const Codec> codec);
	CodecRegistry& add(const MimeType& mimeType, std::shared_ptr<const Codec> codec);

	std::shared_ptr<const Codec> find(const MimeType& mimeType) const;

	// Throws std::out_of_range when nothing is registered for mimeType
	const Codec& get(const MimeType& mimeType) const;

	bool empty() const { return codecs_.empty(); }

private:
	std::map<std::string, std::shared_ptr<const Codec>> codecs_;
};

/**
 * A request body and the MIME type announced for it in Content-Type.
 * Encoding is deferred until the client sends, so failures surface as EncodingError.
 */
class Payload {
public:
	using Encoder = std::function<std::optional<std::string>(const CodecRegistry&)>;

	Payload() = default;
	Payload(std::optional<MimeType> mimeType, Encoder encoder)
		: mimeType_(std::move(mimeType)), encoder_(std::move(encoder)) {}

	static Payload empty();
	static Payload data(std::string body, std::optional<MimeType> mimeType = std::nullopt);
	static Payload text(std::string body);
	static Payload json(Json::Value document, std::shared_ptr<const Codec> codec = nullptr);
	// Encode `document` with the client's codec registered for mimeType
	static Payload encoded(const MimeType& mimeType, Json::Value document);

	template <typename T>
	static Payload json(T value, std::function<Json::Value(const T&)> toJson, std::shared_ptr<const Codec> codec = nullptr) {
		return Payload(MimeType::json(), [value = std::move(value), toJson = std::move(toJson), codec = std::move(codec)](
			const CodecRegistry& codecs) -> std::optional<std::string> {
			const Codec& selected = codec ? *codec : codecs.get(MimeType::json());
			return selected.encode(toJson(value));
		});
	}

	const std::optional<MimeType>& mimeType() const { return mimeType_; }

	// nullopt for an empty payload
	std::optional<std::string> encode(const CodecRegistry& codecs) const {
		return encoder_ ? encoder_(codecs) : std::nullopt;
	}

private:
	std::optional<MimeType> mimeType_;
	Encoder encoder_;
};

/**
 * Turns a response into a T. `mimeType` becomes the Accept header of the request,
 * `expected` lists the status codes the decode step accepts.
 */
template <typename T>
struct ResponseParser {
	using Decoder = std::function<T(const HttpResponse&, const CodecRegistry&)>;

	std::optional<MimeType> mimeType;
	Status expected = Status::successful();
	Decoder decode;

	// Throws HttpError(UnexpectedResponse) when the status is not expected, otherwise whatever decode throws
	T parse(const HttpResponse& response, const CodecRegistry& codecs) const {
		if (!this->expected.contains(response.status))
			throw HttpError::unexpectedResponse(response);
		return this->decode(response, codecs);
	}
};

namespace parsers {

// The response itself
inline ResponseParser<HttpResponse> passthrough(Status expected = Status::successful()) {
	return {std::nullopt, std::move(expected), [](const HttpResponse& response, const CodecRegistry&) { return response; }};
}

// Ignores the body
inline ResponseParser<void> discard(Status expected = Status::successful()) {
	return {std::nullopt, std::move(expected), [](const HttpResponse&, const CodecRegistry&) {}};
}

inline ResponseParser<std::string> text(Status expected = Status::successful()) {
	return {MimeType::text(), std::move(expected), [](const HttpResponse& response, const CodecRegistry&) { return response.body; }};
}

inline ResponseParser<Json::Value> json(Status expected = Status::successful(), std::shared_ptr<const Codec> codec = nullptr) {
	return {MimeType::json(), std::move(expected),
		[codec = std::move(codec)](const HttpResponse& response, const CodecRegistry& codecs) {
			const Codec& selected = codec ? *codec : codecs.get(MimeType::json());
			return selected.decode(response.body);
		}};
}

template <typename T>
ResponseParser<T> json(std::function<T(const Json::Value&)> fromJson, Status expected = Status::successful(),
	std::shared_ptr<const Codec> codec = nullptr) {
	return {MimeType::json(), std::move(expected),
		[fromJson = std::move(fromJson), codec = std::move(codec)](const HttpResponse& response, const CodecRegistry& codecs) {
			const Codec& selected = codec ? *codec : codecs.get(MimeType::json());
			return fromJson(selected.decode(response.body));
		}};
}

// Fully custom decoding, for payloads no registered codec understands
template <typename T>
ResponseParser<T> custom(std::optional<MimeType> mimeType, std::function<T(const HttpResponse&)> decode,
	Status expected = Status::successful()) {
	return {std::move(mimeType), std::move(expected),
		[decode = std::move(decode)](const HttpResponse& response, const CodecRegistry&) { return decode(response); }};
}

} // namespace parsers

template <typename T>
T HttpError::parsed(const ResponseParser<T>& parser, const CodecRegistry& codecs) const {
	if (!this->response_)
		throw std::logic_error(std::string("HttpError ") + std::string(this->kindName()) + " carries no response");
	return parser.decode(*this->response_, codecs);
}

} // namespace http_pipeline
