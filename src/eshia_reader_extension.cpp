#define DUCKDB_EXTENSION_MAIN

#include "eshia_reader_extension.hpp"
#include "read_book_function.hpp"
#include "http_client.hpp"
#include "page_fetcher.hpp"
#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	eshia::InitializeHttpClient();

	// Register eshia_reader_user_agent setting
	config.AddExtensionOption("eshia_reader_user_agent",
	                          "User agent string for reader page requests",
	                          LogicalType::VARCHAR,
	                          Value(eshia::DEFAULT_USER_AGENT));

	// Register eshia_reader_timeout setting
	config.AddExtensionOption("eshia_reader_timeout",
	                          "HTTP request timeout in seconds",
	                          LogicalType::DOUBLE,
	                          Value::DOUBLE(30.0));

	// Register eshia_reader_retries setting
	config.AddExtensionOption("eshia_reader_retries",
	                          "Attempts per page before the crawl fails",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(3));

	// Register read_book() table function
	RegisterReadBookFunction(loader);
}

void EshiaReaderExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string EshiaReaderExtension::Name() {
	return "eshia_reader";
}

std::string EshiaReaderExtension::Version() const {
#ifdef EXT_VERSION_ESHIA_READER
	return EXT_VERSION_ESHIA_READER;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(eshia_reader, loader) {
	duckdb::LoadInternal(loader);
}

}
