#pragma once
#include "strata/fs.hpp"
#include "strata/revision.hpp"
#include "strata/text.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

class Journal; // fwd

enum class EventKind : std::uint8_t { Create, Modify, Delete };

// How an event is stored: "e" while it is the newest content, "h" once a
// later event superseded it, "d" for a delete marker.
enum class EventState : std::uint8_t { Live, Historical, Deleted };

struct Event {
  Revision revision;
  EventKind kind;
  EventState state;
  ContentKind content;
  std::string locator; // artifact file name inside the file's data directory
};

// Parsed "<PREFIX><rev>- <filename>" artifact name.
struct Artifact {
  EventState state;
  ContentKind content;
  Revision revision;
  std::string filename;
};

auto parse_artifact_name(std::string_view name) -> std::optional<Artifact>;
auto artifact_name(EventState state, ContentKind content, Revision revision,
                   std::string_view filename) -> std::string;

// Event log of one tracked path plus content reconstruction.
class VersionedFile {
public:
  VersionedFile(std::filesystem::path data_dir, std::filesystem::path work_path);

  [[nodiscard]] const std::string& name() const { return name_; }
  [[nodiscard]] const std::filesystem::path& data_dir() const { return data_dir_; }
  [[nodiscard]] const std::filesystem::path& work_path() const { return work_path_; }
  [[nodiscard]] const std::map<Revision, Event>& events() const { return events_; }

  // Rehydration from the data store; events may arrive in any order.
  void load_event(EventState state, Revision revision, ContentKind content, std::string locator);

  // After every event is loaded: no delete without a preceding event, and
  // the newest event is live or a delete.
  void check_history() const;

  [[nodiscard]] bool is_new() const { return events_.empty(); }
  [[nodiscard]] Revision last_revision() const { return last_revision_; }
  // Revision of the live ("e") event, if the file currently exists.
  [[nodiscard]] std::optional<Revision> live_revision() const { return live_; }
  [[nodiscard]] bool exists_now() const { return live_.has_value(); }

  [[nodiscard]] bool exists_at(Revision revision) const;
  [[nodiscard]] std::optional<ContentKind> content_kind_at(Revision revision) const;
  [[nodiscard]] fs::Bytes contents_at(Revision revision) const;

  // Commit-time mutations. Each one backs up the artifact it replaces
  // through `journal` first. They return the content kind now stored.
  ContentKind create_at_revision(Revision revision, Journal& journal);
  ContentKind recreate_at_revision(Revision revision, Journal& journal);
  ContentKind change_at_revision(Revision revision, Journal& journal);
  void delete_at_revision(Revision revision, Journal& journal);

  // Working file differs from the live artifact. A missing working file is
  // not a modification.
  [[nodiscard]] bool is_modified() const;

  // Commit-walk scratch state, reset at the start of every walk; never persisted.
  bool touched = false;

private:
  [[nodiscard]] std::filesystem::path artifact_path(const Event& ev) const;
  [[nodiscard]] Text read_text(const Event& ev) const;
  [[nodiscard]] Text merge_text_backwards(const std::vector<Revision>& revisions) const;

  void insert_event(Event ev);
  void write_live(Revision revision, EventKind kind, const fs::Bytes& bytes);
  void historicize_live(Journal& journal, bool as_delta, const fs::Bytes& new_bytes);

  std::filesystem::path data_dir_;
  std::filesystem::path work_path_;
  std::string name_;
  std::map<Revision, Event> events_;
  Revision last_revision_ = 0;
  std::optional<Revision> live_;
};

} // namespace strata
