#pragma once

// RAII wrappers for yyjson allocations used by metadata serialization and
// option parsing

#include <yyjson.h>

#include <cstdlib>
#include <string>

namespace html_markdown {

// RAII wrapper for yyjson_doc (immutable document)
class YyjsonDocGuard {
public:
	explicit YyjsonDocGuard(yyjson_doc *doc) : doc_(doc) {
	}
	~YyjsonDocGuard() {
		if (doc_) {
			yyjson_doc_free(doc_);
		}
	}

	// Non-copyable
	YyjsonDocGuard(const YyjsonDocGuard &) = delete;
	YyjsonDocGuard &operator=(const YyjsonDocGuard &) = delete;

	yyjson_doc *get() const {
		return doc_;
	}
	explicit operator bool() const {
		return doc_ != nullptr;
	}

private:
	yyjson_doc *doc_;
};

// RAII wrapper for yyjson_mut_doc (mutable document)
class YyjsonMutDocGuard {
public:
	YyjsonMutDocGuard() : doc_(yyjson_mut_doc_new(nullptr)) {
	}
	~YyjsonMutDocGuard() {
		if (doc_) {
			yyjson_mut_doc_free(doc_);
		}
	}

	// Non-copyable
	YyjsonMutDocGuard(const YyjsonMutDocGuard &) = delete;
	YyjsonMutDocGuard &operator=(const YyjsonMutDocGuard &) = delete;

	yyjson_mut_doc *get() const {
		return doc_;
	}
	explicit operator bool() const {
		return doc_ != nullptr;
	}

	// Serialize the document root; empty string when writing fails
	std::string Write() const {
		size_t len = 0;
		char *json_str = yyjson_mut_write(doc_, 0, &len);
		if (!json_str) {
			return "";
		}
		std::string result(json_str, len);
		free(json_str);
		return result;
	}

private:
	yyjson_mut_doc *doc_;
};

// Serialize an immutable value back to a compact string
inline std::string YyjsonValueToString(yyjson_val *val) {
	if (!val) {
		return "";
	}
	size_t len = 0;
	char *json_str = yyjson_val_write(val, 0, &len);
	if (!json_str) {
		return "";
	}
	std::string result(json_str, len);
	free(json_str);
	return result;
}

} // namespace html_markdown
