#include "page_text_extractor.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlstring.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <new>

namespace eshia {

//===--------------------------------------------------------------------===//
// Markup conventions of the reader page
//===--------------------------------------------------------------------===//

static const char *READER_CLASS = "book-page-show";
static const char *STICKY_MENU_CLASS = "sticky-menue";
static const char *FOOTNOTE_CLASS = "footnote";
static const char *FOOTNOTE_ANCHOR_MARKER = "_ftn";
static const char *FOOTNOTE_SEPARATOR = "____________\n";
static const char *HEADING_MARKER = "##";

static const char *BLOCK_END_TAGS[] = {
    "address", "article", "aside", "blockquote", "dd", "div", "dl", "dt",
    "fieldset", "figcaption", "figure", "footer", "form", "h1", "h2", "h3",
    "h4", "h5", "h6", "header", "li", "main", "nav", "ol", "p", "section",
    "table", "tr", "ul"};
static const char *FORCED_BREAK_TAGS[] = {"br", "hr"};
static const char *MUTED_TAGS[] = {"script", "style", "noscript"};

template <size_t N>
static bool Matches(const std::string &tag, const char *(&names)[N]) {
	for (size_t i = 0; i < N; i++) {
		if (tag == names[i]) {
			return true;
		}
	}
	return false;
}

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper: Attribute value by name, empty if missing
static std::string GetAttribute(const HtmlAttributes &attrs, const char *name) {
	for (const auto &attr : attrs) {
		if (attr.first == name) {
			return attr.second;
		}
	}
	return "";
}

// Unicode White_Space property
static bool IsUnicodeSpace(int cp) {
	if (cp < 0x80) {
		return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20);
	}
	switch (cp) {
		case 0x85: case 0xA0: case 0x1680:
		case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
			return true;
		default:
			return cp >= 0x2000 && cp <= 0x200A;
	}
}

// Helper: Collapse runs of whitespace (NBSP, ideographic space, ...) into one space
static std::string CollapseWhitespace(const std::string &text) {
	std::string result;
	result.reserve(text.size());
	bool in_space = false;
	const auto *data = reinterpret_cast<const xmlChar *>(text.data());
	size_t pos = 0;
	while (pos < text.size()) {
		int len = static_cast<int>(std::min<size_t>(4, text.size() - pos));
		int cp = xmlGetUTF8Char(data + pos, &len);
		if (cp < 0 || len < 1) {
			// Not UTF-8: pass the byte through
			result += text[pos++];
			in_space = false;
			continue;
		}
		if (IsUnicodeSpace(cp)) {
			if (!in_space) {
				result += ' ';
				in_space = true;
			}
		} else {
			result.append(text, pos, static_cast<size_t>(len));
			in_space = false;
		}
		pos += static_cast<size_t>(len);
	}
	return result;
}

static void TrimTrailingSpaces(std::string &str) {
	size_t end = str.find_last_not_of(' ');
	str.erase(end == std::string::npos ? 0 : end + 1);
}

static bool EndsWith(const std::string &str, char c) {
	return !str.empty() && str.back() == c;
}

bool HasClass(const std::string &class_value, const std::string &class_name) {
	size_t pos = 0;
	while (pos < class_value.length()) {
		while (pos < class_value.length() && std::isspace(static_cast<unsigned char>(class_value[pos]))) {
			pos++;
		}
		size_t end = pos;
		while (end < class_value.length() && !std::isspace(static_cast<unsigned char>(class_value[end]))) {
			end++;
		}
		if (end > pos && class_value.compare(pos, end - pos, class_name) == 0) {
			return true;
		}
		pos = end;
	}
	return false;
}

static bool IsHeadingTag(const std::string &tag, const std::string &class_value) {
	if (tag == "span") {
		return HasClass(class_value, "KalamateKhas");
	}
	if (tag == "p") {
		return HasClass(class_value, "KalamateKhas") || HasClass(class_value, "KalamateKhas2");
	}
	return false;
}

//===--------------------------------------------------------------------===//
// PageTextExtractor
//===--------------------------------------------------------------------===//

void PageTextExtractor::HandleStartTag(const std::string &tag, const HtmlAttributes &attrs) {
	// Links are collected page-wide, suppressed regions included
	if (tag == "a") {
		std::string href = GetAttribute(attrs, "href");
		if (!href.empty()) {
			hrefs_.push_back(href);
		}
	}

	std::string class_value = GetAttribute(attrs, "class");

	if (!in_reader_) {
		if (tag == "td" && HasClass(class_value, READER_CLASS)) {
			found_reader_ = true;
			in_reader_ = true;
			reader_td_depth_ = 1;
		}
		return;
	}

	if (tag == "td") {
		reader_td_depth_++;
	}

	if (sticky_depth_ > 0) {
		sticky_depth_++;
		return;
	}
	if (tag == "div" && HasClass(class_value, STICKY_MENU_CLASS)) {
		sticky_depth_ = 1;
		return;
	}

	if (muted_depth_ > 0) {
		muted_depth_++;
		return;
	}
	if (Matches(tag, MUTED_TAGS)) {
		muted_depth_ = 1;
		return;
	}

	if (IsHeadingTag(tag, class_value)) {
		AppendText(HEADING_MARKER);
	}

	if (footnote_depth_ > 0) {
		footnote_depth_++;
	} else if (HasClass(class_value, FOOTNOTE_CLASS)) {
		footnote_depth_ = 1;
		in_footnote_section_ = true;
	}

	if (tag == "hr") {
		in_footnote_section_ = true;
	}

	if (tag == "a" && !footnote_separator_emitted_ && IsFootnoteAnchor(attrs)) {
		AppendFootnoteSeparator();
		footnote_separator_emitted_ = true;
	}

	if (tag == "pre") {
		pre_depth_++;
	}

	if (Matches(tag, FORCED_BREAK_TAGS)) {
		AppendNewline(true);
	}
}

void PageTextExtractor::HandleEndTag(const std::string &tag) {
	if (!in_reader_) {
		return;
	}

	if (sticky_depth_ > 0) {
		sticky_depth_--;
	} else if (muted_depth_ > 0) {
		muted_depth_--;
	} else {
		if (footnote_depth_ > 0) {
			footnote_depth_--;
		}
		if (tag == "pre" && pre_depth_ > 0) {
			pre_depth_--;
		}
		if (Matches(tag, BLOCK_END_TAGS)) {
			AppendNewline(false);
		}
	}

	if (tag == "td") {
		reader_td_depth_--;
		if (reader_td_depth_ <= 0) {
			CloseReader();
		}
	}
}

void PageTextExtractor::HandleText(const std::string &data) {
	if (!in_reader_ || sticky_depth_ > 0 || muted_depth_ > 0) {
		return;
	}
	AppendText(data);
}

void PageTextExtractor::CloseReader() {
	in_reader_ = false;
	reader_td_depth_ = 0;
	sticky_depth_ = 0;
	muted_depth_ = 0;
	footnote_depth_ = 0;
	in_footnote_section_ = false;
	footnote_separator_emitted_ = false;
}

bool PageTextExtractor::IsFootnoteAnchor(const HtmlAttributes &attrs) const {
	if (footnote_depth_ == 0 && !in_footnote_section_) {
		return false;
	}
	std::string name = ToLower(GetAttribute(attrs, "name"));
	std::string href = ToLower(GetAttribute(attrs, "href"));
	return name.find(FOOTNOTE_ANCHOR_MARKER) != std::string::npos ||
	       href.find(FOOTNOTE_ANCHOR_MARKER) != std::string::npos;
}

void PageTextExtractor::AppendText(const std::string &text) {
	if (text.empty()) {
		return;
	}

	std::string fragment = pre_depth_ == 0 ? CollapseWhitespace(text) : text;

	// Avoid doubled separators at fragment boundaries
	if (parts_.empty() || EndsWith(parts_.back(), '\n') || EndsWith(parts_.back(), ' ')) {
		size_t start = fragment.find_first_not_of(' ');
		fragment.erase(0, start == std::string::npos ? fragment.length() : start);
	}

	if (!fragment.empty()) {
		parts_.push_back(std::move(fragment));
	}
}

void PageTextExtractor::AppendNewline(bool force) {
	if (parts_.empty()) {
		return;
	}

	TrimTrailingSpaces(parts_.back());
	if (parts_.back().empty()) {
		parts_.pop_back();
		if (parts_.empty()) {
			return;
		}
	}

	// A break never stacks onto a bare newline fragment
	if (force) {
		if (parts_.back() != "\n") {
			parts_.push_back("\n");
		}
		return;
	}

	if (!EndsWith(parts_.back(), '\n')) {
		parts_.push_back("\n");
	}
}

void PageTextExtractor::AppendFootnoteSeparator() {
	if (!parts_.empty()) {
		TrimTrailingSpaces(parts_.back());
		if (parts_.back().empty()) {
			parts_.pop_back();
		}
	}

	if (!parts_.empty() && !EndsWith(parts_.back(), '\n')) {
		parts_.push_back("\n");
	}

	parts_.push_back(FOOTNOTE_SEPARATOR);
}

std::string PageTextExtractor::GetText() const {
	std::string joined;
	for (const auto &part : parts_) {
		joined += part;
	}
	size_t start = joined.find_first_not_of('\n');
	if (start == std::string::npos) {
		return "";
	}
	size_t end = joined.find_last_not_of('\n');
	return joined.substr(start, end - start + 1);
}

PageExtraction PageTextExtractor::Finish() {
	PageExtraction result;
	result.text = GetText();
	result.hrefs = std::move(hrefs_);
	result.found_reader = found_reader_;
	parts_.clear();
	return result;
}

//===--------------------------------------------------------------------===//
// libxml2 SAX adapter
//===--------------------------------------------------------------------===//

// RAII wrapper for the HTML push parser context
class HtmlParserGuard {
public:
	explicit HtmlParserGuard(htmlParserCtxtPtr ctxt) : ctxt_(ctxt) {}
	~HtmlParserGuard() {
		if (ctxt_) {
			if (ctxt_->myDoc) {
				xmlFreeDoc(ctxt_->myDoc);
				ctxt_->myDoc = nullptr;
			}
			htmlFreeParserCtxt(ctxt_);
		}
	}

	HtmlParserGuard(const HtmlParserGuard&) = delete;
	HtmlParserGuard& operator=(const HtmlParserGuard&) = delete;

	htmlParserCtxtPtr get() const { return ctxt_; }
	explicit operator bool() const { return ctxt_ != nullptr; }

private:
	htmlParserCtxtPtr ctxt_;
};

static void OnStartElement(void *ctx, const xmlChar *name, const xmlChar **atts) {
	auto *self = static_cast<PageTextExtractor *>(ctx);
	HtmlAttributes attrs;
	if (atts) {
		for (size_t i = 0; atts[i] != nullptr; i += 2) {
			const xmlChar *value = atts[i + 1];
			attrs.emplace_back(ToLower(reinterpret_cast<const char *>(atts[i])),
			                   value ? reinterpret_cast<const char *>(value) : "");
		}
	}
	self->HandleStartTag(ToLower(reinterpret_cast<const char *>(name)), attrs);
}

static void OnEndElement(void *ctx, const xmlChar *name) {
	auto *self = static_cast<PageTextExtractor *>(ctx);
	self->HandleEndTag(ToLower(reinterpret_cast<const char *>(name)));
}

static void OnCharacters(void *ctx, const xmlChar *ch, int len) {
	auto *self = static_cast<PageTextExtractor *>(ctx);
	self->HandleText(std::string(reinterpret_cast<const char *>(ch), static_cast<size_t>(len)));
}

PageExtraction ExtractPageText(const std::string &html) {
	PageTextExtractor extractor;

	htmlSAXHandler handler;
	memset(&handler, 0, sizeof(handler));
	handler.startElement = OnStartElement;
	handler.endElement = OnEndElement;
	handler.characters = OnCharacters;
	// Whitespace between tags still separates words
	handler.ignorableWhitespace = OnCharacters;
	handler.cdataBlock = OnCharacters;

	xmlInitParser();

	HtmlParserGuard ctxt(htmlCreatePushParserCtxt(&handler, &extractor, nullptr, 0, nullptr,
	                                              XML_CHAR_ENCODING_UTF8));
	if (!ctxt) {
		throw std::bad_alloc();
	}

	// Input is already UTF-8: ignore <meta charset> hints
	htmlCtxtUseOptions(ctxt.get(), HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
	                                   HTML_PARSE_NONET | HTML_PARSE_NOIMPLIED | HTML_PARSE_IGNORE_ENC);

	static const size_t CHUNK_SIZE = 1 << 20;
	for (size_t offset = 0; offset < html.size(); offset += CHUNK_SIZE) {
		size_t len = std::min(CHUNK_SIZE, html.size() - offset);
		htmlParseChunk(ctxt.get(), html.data() + offset, static_cast<int>(len), 0);
	}
	htmlParseChunk(ctxt.get(), nullptr, 0, 1);

	return extractor.Finish();
}

} // namespace eshia
