#include "pdf_text_extractor.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/util/text.hpp"

namespace research::acquisition {

namespace {

// Removes the temporary file on scope exit.
class TempFile {
 public:
  explicit TempFile(std::string_view contents) {
    auto pattern = (std::filesystem::temp_directory_path() / "research-pdf-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
      throw std::runtime_error(std::string("mkstemp failed: ") + std::strerror(errno));
    }
    path_.assign(buffer.data());

    size_t written = 0;
    while (written < contents.size()) {
      const auto n = ::write(fd, contents.data() + written, contents.size() - written);
      if (n < 0) {
        if (errno == EINTR) continue;
        const std::string error = std::strerror(errno);
        ::close(fd);
        std::filesystem::remove(path_);
        throw std::runtime_error("temporary pdf write failed: " + error);
      }
      written += static_cast<size_t>(n);
    }
    ::close(fd);
  }

  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  TempFile(const TempFile&)            = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string path_;
};

std::string ShellQuote(std::string_view arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace

PdfText FormatPages(std::string_view raw_text) {
  std::vector<std::string> pages;
  size_t                   begin = 0;
  while (begin <= raw_text.size()) {
    const auto end = raw_text.find('\f', begin);
    if (end == std::string_view::npos) {
      // pdftotext terminates every page with a form feed; the tail is not a page.
      auto tail = util::Trim(raw_text.substr(begin));
      if (!tail.empty() || pages.empty()) pages.push_back(std::move(tail));
      break;
    }
    pages.push_back(util::Trim(raw_text.substr(begin, end - begin)));
    begin = end + 1;
  }

  PdfText                  result;
  std::vector<std::string> blocks;
  bool                     any_text = false;
  for (size_t i = 0; i < pages.size(); ++i) {
    any_text = any_text || !pages[i].empty();
    blocks.push_back("--- page " + std::to_string(i + 1) + " ---\n" + pages[i]);
  }
  result.page_count = static_cast<uint32_t>(pages.size());
  if (any_text) {
    result.text = util::Join(blocks, "\n\n");
  }
  return result;
}

PdftotextExtractor::PdftotextExtractor(std::string tool_path) : tool_path_(std::move(tool_path)) {
}

PdfText PdftotextExtractor::Extract(std::string_view pdf_bytes) {
  TempFile input(pdf_bytes);

  const std::string command = ShellQuote(tool_path_) + " -layout -enc UTF-8 " + ShellQuote(input.Path()) + " - 2>/dev/null";

  FILE* pipe = ::popen(command.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error(std::string("pdftotext spawn failed: ") + std::strerror(errno));
  }

  std::string             output;
  std::array<char, 8192>  buffer{};
  size_t                  n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), n);
  }

  const int status = ::pclose(pipe);
  if (status == -1) {
    throw std::runtime_error("pdftotext wait failed");
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    throw std::runtime_error("pdftotext exited with status " + std::to_string(code));
  }

  return FormatPages(output);
}

} // namespace research::acquisition
