#pragma once

// RAII wrappers for yyjson allocations

#include <cstdlib>
#include <yyjson.h>

namespace harvester {

// Owns a yyjson_doc (immutable document)
class YyjsonDocGuard {
public:
	explicit YyjsonDocGuard(yyjson_doc *doc) : doc_(doc) {}
	~YyjsonDocGuard() { if (doc_) yyjson_doc_free(doc_); }

	YyjsonDocGuard(const YyjsonDocGuard&) = delete;
	YyjsonDocGuard& operator=(const YyjsonDocGuard&) = delete;

	yyjson_doc* get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }

private:
	yyjson_doc *doc_;
};

// Owns a yyjson_mut_doc (mutable document)
class YyjsonMutDocGuard {
public:
	YyjsonMutDocGuard() : doc_(yyjson_mut_doc_new(nullptr)) {}
	~YyjsonMutDocGuard() { if (doc_) yyjson_mut_doc_free(doc_); }

	YyjsonMutDocGuard(const YyjsonMutDocGuard&) = delete;
	YyjsonMutDocGuard& operator=(const YyjsonMutDocGuard&) = delete;

	yyjson_mut_doc* get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }

private:
	yyjson_mut_doc *doc_;
};

// Owns the malloc'd buffer returned by yyjson_mut_write
class YyjsonStringGuard {
public:
	explicit YyjsonStringGuard(char *str) : str_(str) {}
	~YyjsonStringGuard() { free(str_); }

	YyjsonStringGuard(const YyjsonStringGuard&) = delete;
	YyjsonStringGuard& operator=(const YyjsonStringGuard&) = delete;

	const char* get() const { return str_; }
	explicit operator bool() const { return str_ != nullptr; }

private:
	char *str_;
};

} // namespace harvester
