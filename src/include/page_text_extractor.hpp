#pragma once

#include <string>
#include <utility>
#include <vector>

namespace eshia {

//===--------------------------------------------------------------------===//
// PageExtraction - Result of one extraction pass over one page
//===--------------------------------------------------------------------===//
struct PageExtraction {
	std::string text;               // Normalized reading-region text
	std::vector<std::string> hrefs; // Every <a href> on the page, document order
	bool found_reader = false;      // Reading region was entered at least once
};

using HtmlAttributes = std::vector<std::pair<std::string, std::string>>;

//===--------------------------------------------------------------------===//
// PageTextExtractor - Tag/text event state machine for one page
//===--------------------------------------------------------------------===//
// Text is only collected inside the reading region (td.book-page-show).
// The navigation overlay (div.sticky-menue) and script/style/noscript
// subtrees are suppressed. Footnotes get a one-time separator line.
// Tag names are expected lowercase. Create one instance per page.
class PageTextExtractor {
public:
	PageTextExtractor() = default;

	// Non-copyable: holds per-page state
	PageTextExtractor(const PageTextExtractor&) = delete;
	PageTextExtractor& operator=(const PageTextExtractor&) = delete;

	void HandleStartTag(const std::string &tag, const HtmlAttributes &attrs);
	void HandleEndTag(const std::string &tag);
	void HandleText(const std::string &data);

	// Concatenated text with leading/trailing newlines stripped
	std::string GetText() const;
	const std::vector<std::string> &GetHrefs() const { return hrefs_; }
	bool FoundReader() const { return found_reader_; }

	// Moves results out; the extractor must not be fed afterwards
	PageExtraction Finish();

private:
	void AppendText(const std::string &text);
	void AppendNewline(bool force);
	void AppendFootnoteSeparator();
	bool IsFootnoteAnchor(const HtmlAttributes &attrs) const;
	void CloseReader();

	std::vector<std::string> hrefs_;
	bool found_reader_ = false;
	bool in_reader_ = false;
	int reader_td_depth_ = 0;
	int sticky_depth_ = 0;
	int muted_depth_ = 0;
	int footnote_depth_ = 0;
	bool in_footnote_section_ = false;
	bool footnote_separator_emitted_ = false;
	int pre_depth_ = 0;
	std::vector<std::string> parts_;
};

// Tokenize UTF-8 page markup with libxml2's HTML SAX parser and run the
// extraction state machine over it in a single pass
PageExtraction ExtractPageText(const std::string &html);

// Class attribute contains class_name as a whole whitespace-separated token
bool HasClass(const std::string &class_value, const std::string &class_name);

} // namespace eshia
