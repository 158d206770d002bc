#include "output_writer.hpp"
#include "crawler_utils.hpp"
#include "reader_exception.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace eshia {

const char *PAGE_SEPARATOR = "PAGE_SEPARATOR";

std::string JoinPages(const std::vector<CrawledPage> &pages) {
	const std::string separator = std::string("\n") + PAGE_SEPARATOR + "\n";

	std::string merged;
	for (size_t i = 0; i < pages.size(); i++) {
		if (i > 0) {
			merged += separator;
		}
		merged += pages[i].text;
	}
	return merged;
}

void WriteBookText(const std::string &path, const std::vector<CrawledPage> &pages) {
	if (path.empty()) {
		throw OutputException("Output path is empty");
	}

	const std::string content = NormalizeLineEndings(JoinPages(pages));
	const std::string temp_path = path + ".tmp";

	{
		std::ofstream out(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
		if (!out) {
			throw OutputException("Cannot open " + temp_path + " for writing: " + std::strerror(errno));
		}
		out.write(content.data(), static_cast<std::streamsize>(content.size()));
		out.flush();
		if (!out) {
			out.close();
			std::remove(temp_path.c_str());
			throw OutputException("Failed writing " + temp_path);
		}
	}

	if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
		std::string reason = std::strerror(errno);
		std::remove(temp_path.c_str());
		throw OutputException("Cannot move " + temp_path + " to " + path + ": " + reason);
	}
}

} // namespace eshia
