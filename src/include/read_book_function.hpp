#pragma once

#include "duckdb.hpp"

namespace duckdb {

class ExtensionLoader;

// read_book(start_url, max_pages := ..., delay := ..., timeout := ..., retries := ...)
void RegisterReadBookFunction(ExtensionLoader &loader);

} // namespace duckdb
