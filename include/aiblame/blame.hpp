#pragma once
#include "aiblame/attribution.hpp"
#include "aiblame/notes.hpp"
#include "aiblame/repo.hpp"

#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

struct BlameLine {
  int line = 0;          // 1-indexed in the blamed revision
  std::string content;
  ContributorKind kind = ContributorKind::Human;
  std::string tool;
  std::string session_id;
  std::string prompt_digest;
  std::string commit;    // commit that introduced the line
  int origin_line = 0;   // line number inside that commit's version of the file
};

// Where a line of the blamed file came from.
struct LineOrigin {
  std::string commit;
  int line = 0;
};

// Lines of one file with their introducing commits. Attribution is looked up
// while iterating, each introducing commit's record at most once; iterating
// again starts over from line 1 and reuses what was already read.
class BlameView {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = BlameLine;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = BlameLine;

    iterator() = default;
    BlameLine operator*() const { return view_->at(pos_); }
    iterator& operator++() {
      ++pos_;
      return *this;
    }
    iterator operator++(int) {
      iterator tmp = *this;
      ++pos_;
      return tmp;
    }
    bool operator==(const iterator& o) const { return pos_ == o.pos_; }

  private:
    friend class BlameView;
    iterator(const BlameView* view, std::size_t pos) : view_(view), pos_(pos) {}
    const BlameView* view_ = nullptr;
    std::size_t pos_ = 0;
  };

  BlameView(std::string path, std::vector<std::string> content, std::vector<LineOrigin> origins,
            const NotesRepository& notes);

  [[nodiscard]] iterator begin() const { return {this, 0}; }
  [[nodiscard]] iterator end() const { return {this, origins_.size()}; }
  [[nodiscard]] std::size_t size() const { return origins_.size(); }
  [[nodiscard]] bool empty() const { return origins_.empty(); }
  [[nodiscard]] const std::string& path() const { return path_; }

  // Line `index` (0-based), attribution resolved.
  [[nodiscard]] BlameLine at(std::size_t index) const;

  // Prompt text for a digest, from the records read so far.
  [[nodiscard]] std::optional<std::string> prompt(std::string_view digest) const;

private:
  using RecordCache = std::map<std::string, std::optional<AttributionRecord>>;

  const std::optional<AttributionRecord>& record_of(const std::string& commit) const;

  std::string path_;
  std::vector<std::string> content_;
  std::vector<LineOrigin> origins_;
  const NotesRepository* notes_;
  std::shared_ptr<RecordCache> cache_;
};

class BlameEngine {
public:
  BlameEngine(const Repository& repo, const NotesRepository& notes) : repo_(repo), notes_(notes) {}

  // Per-line attribution of `path` as of `rev`. Throws RevisionError for a
  // bad revision and ObjectError when the file does not exist there.
  [[nodiscard]] BlameView blame(std::string_view path, std::string_view rev = "HEAD") const;

  // Native line history only: the introducing commit of every line.
  [[nodiscard]] std::vector<LineOrigin> origins(std::string_view path,
                                                std::string_view commit_hex) const;

private:
  const Repository& repo_;
  const NotesRepository& notes_;
};

} // namespace aiblame
