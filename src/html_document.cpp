#include "html_document.hpp"
#include "harvest_utils.hpp"

#include <libxml/HTMLparser.h>
#include <sstream>

namespace harvester {

static bool IsElement(xmlNodePtr node, const char *name) {
	return node->type == XML_ELEMENT_NODE && xmlStrcasecmp(node->name, BAD_CAST name) == 0;
}

HtmlDocument::HtmlDocument(const std::string &html) : doc_(nullptr) {
	if (html.empty()) {
		return;
	}
	doc_ = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
	                      HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
}

HtmlDocument::~HtmlDocument() {
	if (doc_) {
		xmlFreeDoc(doc_);
	}
}

HtmlDocument::HtmlDocument(HtmlDocument &&other) noexcept : doc_(other.doc_) {
	other.doc_ = nullptr;
}

HtmlDocument &HtmlDocument::operator=(HtmlDocument &&other) noexcept {
	if (this != &other) {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
		doc_ = other.doc_;
		other.doc_ = nullptr;
	}
	return *this;
}

xmlNodePtr HtmlDocument::Root() const {
	return doc_ ? xmlDocGetRootElement(doc_) : nullptr;
}

std::string HtmlDocument::GetAttribute(xmlNodePtr node, const char *attr) {
	xmlChar *value = xmlGetProp(node, BAD_CAST attr);
	if (!value) {
		return "";
	}
	std::string result(reinterpret_cast<char *>(value));
	xmlFree(value);
	return result;
}

std::string HtmlDocument::NodeText(xmlNodePtr node) {
	xmlChar *content = xmlNodeGetContent(node);
	if (!content) {
		return "";
	}
	std::string result(reinterpret_cast<char *>(content));
	xmlFree(content);
	return CollapseWhitespace(result);
}

bool HtmlDocument::HasClass(xmlNodePtr node, const std::string &css_class) {
	std::istringstream classes(GetAttribute(node, "class"));
	std::string token;
	while (classes >> token) {
		if (token == css_class) {
			return true;
		}
	}
	return false;
}

// Depth-first, document order. Stops once `limit` matches were visited.
static void FindElements(xmlNodePtr node, const char *tag, const std::string &class_filter, size_t limit,
                         std::vector<xmlNodePtr> &found) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (limit > 0 && found.size() >= limit) {
			return;
		}
		if (cur->type != XML_ELEMENT_NODE) {
			continue;
		}
		if (xmlStrcasecmp(cur->name, BAD_CAST tag) == 0 &&
		    (class_filter.empty() || HtmlDocument::HasClass(cur, class_filter))) {
			found.push_back(cur);
		}
		if (cur->children) {
			FindElements(cur->children, tag, class_filter, limit, found);
		}
	}
}

std::string HtmlDocument::Title() const {
	if (!IsValid()) {
		return "";
	}
	std::vector<xmlNodePtr> titles;
	FindElements(Root(), "title", "", 1, titles);
	if (titles.empty()) {
		return "";
	}
	return NodeText(titles.front());
}

std::vector<std::string> HtmlDocument::CollectText(const std::string &tag, size_t limit,
                                                   const std::string &class_filter) const {
	std::vector<std::string> texts;
	if (!IsValid()) {
		return texts;
	}
	std::vector<xmlNodePtr> nodes;
	FindElements(Root(), tag.c_str(), class_filter, limit, nodes);
	for (auto node : nodes) {
		std::string text = NodeText(node);
		if (!text.empty()) {
			texts.push_back(std::move(text));
		}
	}
	return texts;
}

std::vector<HtmlLink> HtmlDocument::CollectLinks(size_t limit) const {
	std::vector<HtmlLink> links;
	if (!IsValid()) {
		return links;
	}
	std::vector<xmlNodePtr> nodes;
	FindElements(Root(), "a", "", limit, nodes);
	for (auto node : nodes) {
		links.push_back(HtmlLink {NodeText(node), GetAttribute(node, "href")});
	}
	return links;
}

static std::vector<std::string> RowCells(xmlNodePtr row, bool &has_header_cell) {
	std::vector<std::string> cells;
	has_header_cell = false;
	for (xmlNodePtr cell = row->children; cell; cell = cell->next) {
		if (IsElement(cell, "th")) {
			has_header_cell = true;
			cells.push_back(HtmlDocument::NodeText(cell));
		} else if (IsElement(cell, "td")) {
			cells.push_back(HtmlDocument::NodeText(cell));
		}
	}
	return cells;
}

std::vector<HtmlTable> HtmlDocument::Tables() const {
	std::vector<HtmlTable> tables;
	if (!IsValid()) {
		return tables;
	}
	std::vector<xmlNodePtr> table_nodes;
	FindElements(Root(), "table", "", 0, table_nodes);
	for (auto table_node : table_nodes) {
		HtmlTable table;
		std::vector<xmlNodePtr> rows;
		FindElements(table_node->children, "tr", "", 0, rows);
		for (auto row : rows) {
			bool has_header_cell = false;
			auto cells = RowCells(row, has_header_cell);
			if (cells.empty()) {
				continue;
			}
			if (table.header.empty() && table.rows.empty() && has_header_cell) {
				table.header = std::move(cells);
			} else {
				table.rows.push_back(std::move(cells));
			}
		}
		tables.push_back(std::move(table));
	}
	return tables;
}

} // namespace harvester
