#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace http_pipeline {

/**
 * A set of accepted HTTP status codes, expressed as half-open ranges [first, second).
 * Used by response parsers to express which status codes they expect.
 */
struct Status {
	std::vector<std::pair<long, long>> codes;
	std::string description;

	static Status code(long code, std::string description = "") {
		return Status{{{code, code + 1}}, std::move(description)};
	}
	static Status range(long first, long last, std::string description = "") {
		return Status{{{first, last}}, std::move(description)};
	}

	static Status ok() { return code(200, "OK"); }
	static Status created() { return code(201, "Created"); }
	static Status noContent() { return code(204, "No Content"); }
	static Status successful() { return range(200, 300, "Successful"); }
	static Status successfulOrRedirection() { return range(200, 400, "Successful or Redirection"); }

	// Union of both sets
	Status operator|(const Status& other) const {
		Status merged = *this;
		merged.codes.insert(merged.codes.end(), other.codes.begin(), other.codes.end());
		if (!other.description.empty())
			merged.description = merged.description.empty() ? other.description : merged.description + " | " + other.description;
		return merged;
	}

	bool contains(long status) const {
		for (const auto& range : this->codes)
			if (status >= range.first && status < range.second)
				return true;
		return false;
	}
};

enum class StatusClass : uint8_t { Success, Redirection, ClientError, ServerError, Unexpected };

inline StatusClass classify(long status) {
	if (status >= 200 && status < 300)
		return StatusClass::Success;
	if (status >= 300 && status < 400)
		return StatusClass::Redirection;
	if (status >= 400 && status < 500)
		return StatusClass::ClientError;
	if (status >= 500 && status < 600)
		return StatusClass::ServerError;
	return StatusClass::Unexpected;
}

} // namespace http_pipeline
