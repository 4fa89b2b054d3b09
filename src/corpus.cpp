#include "corpus.hpp"
#include "generators.hpp"
#include <iostream>

namespace canfuzz {

CorpusWriter::~CorpusWriter() {
  close();
}

bool CorpusWriter::open(const std::string& path, bool truncate) {
  close();
  out_.open(path, truncate ? (std::ios::out | std::ios::trunc) : (std::ios::out | std::ios::app));
  if (!out_.is_open()) {
    std::cerr << "Failed to open corpus file " << path << "\n";
    return false;
  }
  path_ = path;
  written_ = 0;
  return true;
}

void CorpusWriter::close() {
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

bool CorpusWriter::append(const Directive& directive) {
  if (!out_.is_open()) return false;
  out_ << DirectiveCodec::format(directive);
  out_.flush();
  if (!out_) return false;
  ++written_;
  return true;
}

bool generate_corpus(const std::string& path, size_t amount, Generator& generator) {
  CorpusWriter writer;
  if (!writer.open(path, true)) return false;

  Directive d;
  for (size_t i = 0; i < amount; ++i) {
    const NextStatus status = generator.next(d);
    if (status == NextStatus::Exhausted) break;
    if (status == NextStatus::InvalidDirective) {
      std::cerr << "Corpus generation failed: " << generator.last_error() << "\n";
      return false;
    }
    if (!writer.append(d)) {
      std::cerr << "Failed to write corpus file " << path << "\n";
      return false;
    }
  }
  return true;
}

} // namespace canfuzz
