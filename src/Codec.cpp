#include "Codec.hpp"

#include <memory>
#include <stdexcept>

namespace http_pipeline {

// JsonCodec implementation
JsonCodec::JsonCodec(std::string indentation) : indentation_(std::move(indentation)) {}

std::string JsonCodec::encode(const Json::Value& document) const {
	Json::StreamWriterBuilder wbuilder;
	wbuilder.settings_["indentation"] = this->indentation_;
	return Json::writeString(wbuilder, document);
}

Json::Value JsonCodec::decode(std::string_view bytes) const {
	Json::CharReaderBuilder rbuilder;
	rbuilder.settings_["failIfExtra"] = true;
	std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());

	Json::Value root;
	std::string errors;
	if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), &root, &errors))
		throw std::runtime_error("Failed to parse JSON: " + errors);
	return root;
}

// CodecRegistry implementation
CodecRegistry CodecRegistry::withDefaults() {
	CodecRegistry registry;
	registry.add(std::make_shared<JsonCodec>());
	return registry;
}

CodecRegistry& CodecRegistry::add(std::shared_ptr<const Codec> codec) {
	if (!codec) throw std::invalid_argument("CodecRegistry: null codec");
	MimeType mimeType = codec->mimeType();
	return this->add(mimeType, std::move(codec));
}

CodecRegistry& CodecRegistry::add(const MimeType& mimeType, std::shared_ptr<const Codec> codec) {
	if (!codec) throw std::invalid_argument("CodecRegistry: null codec");
	this->codecs_[mimeType.essence()] = std::move(codec);
	return *this;
}

std::shared_ptr<const Codec> CodecRegistry::find(const MimeType& mimeType) const {
	auto it = this->codecs_.find(mimeType.essence());
	return it == this->codecs_.end() ? nullptr : it->second;
}

const Codec& CodecRegistry::get(const MimeType& mimeType) const {
	auto it = this->codecs_.find(mimeType.essence());
	if (it == this->codecs_.end())
		throw std::out_of_range("No codec registered for " + mimeType.rawValue);
	return *it->second;
}

// Payload implementation
Payload Payload::empty() {
	return Payload();
}

Payload Payload::data(std::string body, std::optional<MimeType> mimeType) {
	return Payload(std::move(mimeType), [body = std::move(body)](const CodecRegistry&) -> std::optional<std::string> {
		return body;
	});
}

Payload Payload::text(std::string body) {
	return data(std::move(body), MimeType::text());
}

Payload Payload::json(Json::Value document, std::shared_ptr<const Codec> codec) {
	return Payload(MimeType::json(), [document = std::move(document), codec = std::move(codec)](
		const CodecRegistry& codecs) -> std::optional<std::string> {
		const Codec& selected = codec ? *codec : codecs.get(MimeType::json());
		return selected.encode(document);
	});
}

Payload Payload::encoded(const MimeType& mimeType, Json::Value document) {
	return Payload(mimeType, [mimeType, document = std::move(document)](
		const CodecRegistry& codecs) -> std::optional<std::string> {
		return codecs.get(mimeType).encode(document);
	});
}

} // namespace http_pipeline
