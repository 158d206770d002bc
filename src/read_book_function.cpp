// read_book() table function - crawl one book through its page links
//
// Usage:
//   SELECT volume, page, text
//   FROM read_book('https://lib.eshia.ir/15050/1/0', max_pages := 50, delay := 0.5)
//   ORDER BY rowid;
//
// Rows come back in reading order. The crawl runs on the first scan call;
// a transport failure or a page without a reading region aborts the query.

#include "read_book_function.hpp"
#include "book_crawler.hpp"
#include "crawler_utils.hpp"
#include "page_fetcher.hpp"
#include "reader_exception.hpp"

#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Bind Data
//===--------------------------------------------------------------------===//

struct ReadBookBindData : public TableFunctionData {
	string start_url;
	eshia::CrawlOptions options;
	string user_agent = eshia::DEFAULT_USER_AGENT;
};

//===--------------------------------------------------------------------===//
// Global State
//===--------------------------------------------------------------------===//

struct ReadBookGlobalState : public GlobalTableFunctionState {
	eshia::CrawlResult result;
	idx_t current_idx = 0;
	bool fetched = false;

	idx_t MaxThreads() const override { return 1; }
};

//===--------------------------------------------------------------------===//
// Bind Function
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> ReadBookBind(ClientContext &context,
                                             TableFunctionBindInput &input,
                                             vector<LogicalType> &return_types,
                                             vector<string> &names) {
	auto bind_data = make_uniq<ReadBookBindData>();

	if (!input.inputs.empty() && !input.inputs[0].IsNull()) {
		bind_data->start_url = StringValue::Get(input.inputs[0]);
	} else {
		throw InvalidInputException("read_book() requires a start URL argument");
	}

	// Session settings first, named parameters override them
	Value setting;
	if (context.TryGetCurrentSetting("eshia_reader_user_agent", setting) && !setting.IsNull()) {
		bind_data->user_agent = StringValue::Get(setting);
	}
	if (context.TryGetCurrentSetting("eshia_reader_timeout", setting) && !setting.IsNull()) {
		bind_data->options.timeout_seconds = setting.GetValue<double>();
	}
	if (context.TryGetCurrentSetting("eshia_reader_retries", setting) && !setting.IsNull()) {
		bind_data->options.retries = static_cast<int>(setting.GetValue<int64_t>());
	}

	for (auto &kv : input.named_parameters) {
		if (kv.second.IsNull()) {
			continue;
		}
		if (kv.first == "max_pages") {
			bind_data->options.max_pages = kv.second.GetValue<int64_t>();
		} else if (kv.first == "delay") {
			bind_data->options.delay_seconds = kv.second.GetValue<double>();
		} else if (kv.first == "timeout") {
			bind_data->options.timeout_seconds = kv.second.GetValue<double>();
		} else if (kv.first == "retries") {
			bind_data->options.retries = kv.second.GetValue<int>();
		} else if (kv.first == "user_agent") {
			bind_data->user_agent = StringValue::Get(kv.second);
		}
	}

	// Reject bad input before any network activity
	string url_error = eshia::GetUrlValidationError(bind_data->start_url);
	if (!url_error.empty()) {
		throw InvalidInputException("read_book(): " + url_error);
	}
	try {
		eshia::ValidateCrawlOptions(bind_data->options);
	} catch (const eshia::ArgumentException &e) {
		throw InvalidInputException("read_book(): %s", e.what());
	}

	return_types.push_back(LogicalType::BIGINT);   // book_id
	names.push_back("book_id");

	return_types.push_back(LogicalType::BIGINT);   // volume
	names.push_back("volume");

	return_types.push_back(LogicalType::BIGINT);   // page
	names.push_back("page");

	return_types.push_back(LogicalType::VARCHAR);  // url
	names.push_back("url");

	return_types.push_back(LogicalType::VARCHAR);  // text
	names.push_back("text");

	return std::move(bind_data);
}

//===--------------------------------------------------------------------===//
// Init Global
//===--------------------------------------------------------------------===//

static unique_ptr<GlobalTableFunctionState> ReadBookInitGlobal(ClientContext &context,
                                                               TableFunctionInitInput &input) {
	return make_uniq<ReadBookGlobalState>();
}

//===--------------------------------------------------------------------===//
// Table Function
//===--------------------------------------------------------------------===//

static void ReadBookFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &bind_data = data.bind_data->Cast<ReadBookBindData>();
	auto &state = data.global_state->Cast<ReadBookGlobalState>();

	// Crawl the whole book on first call
	if (!state.fetched) {
		try {
			eshia::CurlPageFetcher fetcher(bind_data.user_agent);
			eshia::BookCrawler crawler(fetcher, bind_data.options);
			state.result = crawler.Run(bind_data.start_url);
		} catch (const eshia::InvalidPageUrlException &e) {
			throw InvalidInputException("read_book(): %s", e.what());
		} catch (const eshia::ReaderException &e) {
			throw IOException("read_book() %s: %s", eshia::ReaderErrorTypeToString(e.GetType()), e.what());
		}
		state.fetched = true;
	}

	idx_t count = 0;
	while (count < STANDARD_VECTOR_SIZE && state.current_idx < state.result.pages.size()) {
		const auto &page = state.result.pages[state.current_idx++];

		output.SetValue(0, count, Value::BIGINT(page.ref.book_id));
		output.SetValue(1, count, Value::BIGINT(page.ref.volume));
		output.SetValue(2, count, Value::BIGINT(page.ref.page));
		output.SetValue(3, count, Value(page.url));
		output.SetValue(4, count, Value(page.text));

		count++;
	}

	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Register Function
//===--------------------------------------------------------------------===//

void RegisterReadBookFunction(ExtensionLoader &loader) {
	TableFunction read_book_func("read_book", {LogicalType::VARCHAR}, ReadBookFunction,
	                             ReadBookBind, ReadBookInitGlobal);

	read_book_func.named_parameters["max_pages"] = LogicalType::BIGINT;
	read_book_func.named_parameters["delay"] = LogicalType::DOUBLE;
	read_book_func.named_parameters["timeout"] = LogicalType::DOUBLE;
	read_book_func.named_parameters["retries"] = LogicalType::INTEGER;
	read_book_func.named_parameters["user_agent"] = LogicalType::VARCHAR;

	loader.RegisterFunction(read_book_func);
}

} // namespace duckdb
