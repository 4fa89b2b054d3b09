#ifndef CANFUZZ_CORPUS_HPP
#define CANFUZZ_CORPUS_HPP

/**
 * @file corpus.hpp
 * @brief Corpus file persistence
 *
 * Corpus format: UTF-8 text, one canonical directive per line, no header.
 *
 *   123#FFFFFFFF
 *   7DF#0210030000000000
 *
 * CorpusWriter appends (never seeks or truncates mid-run) and flushes each
 * line, so an interrupted run leaves every directive it sent on disk.
 */

#include "directive.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace canfuzz {

class Generator;

class CorpusWriter {
public:
  CorpusWriter() = default;
  ~CorpusWriter();

  CorpusWriter(const CorpusWriter&) = delete;
  CorpusWriter& operator=(const CorpusWriter&) = delete;

  /// Open `path` for appending (truncate = start a fresh file)
  bool open(const std::string& path, bool truncate = false);
  void close();
  bool is_open() const { return out_.is_open(); }

  bool append(const Directive& directive);

  const std::string& path() const { return path_; }
  uint64_t written() const { return written_; }

private:
  std::ofstream out_;
  std::string path_;
  uint64_t written_{0};
};

/// Write `amount` directives drawn from `generator` to a fresh file at `path`.
/// Stops early if the generator runs out. Returns false on I/O failure or
/// if the generator reports malformed data.
bool generate_corpus(const std::string& path, size_t amount, Generator& generator);

} // namespace canfuzz

#endif // CANFUZZ_CORPUS_HPP
