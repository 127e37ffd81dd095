#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <libxml/tree.h>

namespace harvester {

struct HtmlLink {
	std::string text;
	std::string href;
};

// Cell text per row; rows that mix th/td keep document order
struct HtmlTable {
	std::vector<std::string> header;
	std::vector<std::vector<std::string>> rows;
};

// Parsed HTML page (libxml2, recovering parser). Move-only; frees the
// document on destruction.
class HtmlDocument {
public:
	explicit HtmlDocument(const std::string &html);
	~HtmlDocument();

	HtmlDocument(const HtmlDocument &) = delete;
	HtmlDocument &operator=(const HtmlDocument &) = delete;
	HtmlDocument(HtmlDocument &&other) noexcept;
	HtmlDocument &operator=(HtmlDocument &&other) noexcept;

	bool IsValid() const {
		return doc_ != nullptr && Root() != nullptr;
	}

	// Text of the first <title>, whitespace-collapsed; empty if absent
	std::string Title() const;

	// Texts of the first `limit` <tag> elements (optionally carrying css class
	// `class_filter`); empty texts are dropped after collapsing whitespace.
	// limit == 0 means no limit.
	std::vector<std::string> CollectText(const std::string &tag, size_t limit,
	                                     const std::string &class_filter = "") const;

	// First `limit` anchors with their text and raw href
	std::vector<HtmlLink> CollectLinks(size_t limit) const;

	std::vector<HtmlTable> Tables() const;

	// Attribute value, empty if missing
	static std::string GetAttribute(xmlNodePtr node, const char *attr);
	static std::string NodeText(xmlNodePtr node);
	static bool HasClass(xmlNodePtr node, const std::string &css_class);

private:
	xmlNodePtr Root() const;

	xmlDocPtr doc_;
};

} // namespace harvester
