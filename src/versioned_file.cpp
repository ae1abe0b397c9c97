#include "strata/versioned_file.hpp"

#include "strata/consts.hpp"
#include "strata/delta.hpp"
#include "strata/error.hpp"
#include "strata/journal.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <regex>

namespace strata {

namespace {

std::string rev_str(Revision r) { return std::to_string(r); }

} // namespace

auto parse_artifact_name(std::string_view name) -> std::optional<Artifact> {
  static const std::regex re{std::string(consts::kArtifactPattern)};
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_match(name.begin(), name.end(), m, re)) {
    return std::nullopt;
  }
  const std::string prefix = m[1].str();
  const std::string digits = m[2].str();

  Revision rev = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), rev);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }

  Artifact a{.state = EventState::Deleted,
             .content = ContentKind::Binary,
             .revision = rev,
             .filename = m[3].str()};
  if (prefix == consts::kLiveText) {
    a.state = EventState::Live;
    a.content = ContentKind::Text;
  } else if (prefix == consts::kLiveBinary) {
    a.state = EventState::Live;
  } else if (prefix == consts::kHistText) {
    a.state = EventState::Historical;
    a.content = ContentKind::Text;
  } else if (prefix == consts::kHistBinary) {
    a.state = EventState::Historical;
  }
  return a;
}

auto artifact_name(EventState state, ContentKind content, Revision revision,
                   std::string_view filename) -> std::string {
  std::string_view prefix;
  switch (state) {
  case EventState::Live:
    prefix = content == ContentKind::Text ? consts::kLiveText : consts::kLiveBinary;
    break;
  case EventState::Historical:
    prefix = content == ContentKind::Text ? consts::kHistText : consts::kHistBinary;
    break;
  case EventState::Deleted:
    prefix = consts::kDeleteMarker;
    break;
  }
  std::string out(prefix);
  out += rev_str(revision);
  out += consts::kRevSeparator;
  out += filename;
  return out;
}

VersionedFile::VersionedFile(std::filesystem::path data_dir, std::filesystem::path work_path)
    : data_dir_(std::move(data_dir)), work_path_(std::move(work_path)),
      name_(work_path_.filename().string()) {}

std::filesystem::path VersionedFile::artifact_path(const Event &ev) const {
  return data_dir_ / ev.locator;
}

void VersionedFile::insert_event(Event ev) {
  auto [it, inserted] = events_.emplace(ev.revision, std::move(ev));
  if (!inserted) {
    throw Error(ErrorKind::DuplicateEntry,
                "duplicate event at revision " + rev_str(it->first) + " for " + name_);
  }
  // Create vs modify depends on the neighbouring events.
  auto kind_after = [](const Event *prev) {
    return prev == nullptr || prev->kind == EventKind::Delete ? EventKind::Create
                                                              : EventKind::Modify;
  };
  const Event *prev = it == events_.begin() ? nullptr : &std::prev(it)->second;
  if (it->second.state != EventState::Deleted) {
    it->second.kind = kind_after(prev);
  }
  if (auto next = std::next(it); next != events_.end() && next->second.state != EventState::Deleted) {
    next->second.kind = kind_after(&it->second);
  }
  last_revision_ = std::max(last_revision_, it->first);
}

void VersionedFile::load_event(EventState state, Revision revision, ContentKind content,
                               std::string locator) {
  if (revision == 0) {
    throw Error(ErrorKind::InvalidEventOrder, "event at revision 0 for " + name_);
  }
  if (events_.contains(revision)) {
    throw Error(ErrorKind::DuplicateEntry,
                "duplicate event at revision " + rev_str(revision) + " for " + name_);
  }
  if (state == EventState::Live) {
    if (live_) {
      throw Error(ErrorKind::InvalidEventOrder, "second live event (" + rev_str(revision) +
                                                    ", " + rev_str(*live_) + ") for " + name_);
    }
    if (revision < last_revision_) {
      throw Error(ErrorKind::InvalidEventOrder, "live event " + rev_str(revision) +
                                                    " older than revision " +
                                                    rev_str(last_revision_) + " for " + name_);
    }
  } else if (live_ && revision > *live_) {
    throw Error(ErrorKind::InvalidEventOrder, "event " + rev_str(revision) +
                                                  " after live event " + rev_str(*live_) +
                                                  " for " + name_);
  }

  insert_event(Event{.revision = revision,
                     .kind = state == EventState::Deleted ? EventKind::Delete : EventKind::Modify,
                     .state = state,
                     .content = content,
                     .locator = std::move(locator)});
  if (state == EventState::Live) {
    live_ = revision;
  }
}

void VersionedFile::check_history() const {
  const Event *prev = nullptr;
  for (const auto &[rev, ev] : events_) {
    if (ev.state == EventState::Deleted && (prev == nullptr || prev->state == EventState::Deleted)) {
      throw Error(ErrorKind::InvalidEventOrder,
                  "delete at revision " + rev_str(rev) + " without a prior event for " + name_);
    }
    prev = &ev;
  }
  if (prev != nullptr && prev->state == EventState::Historical) {
    throw Error(ErrorKind::InvalidEventOrder,
                "newest event " + rev_str(prev->revision) + " is historical for " + name_);
  }
}

bool VersionedFile::exists_at(Revision revision) const {
  auto it = events_.upper_bound(revision);
  if (it == events_.begin()) {
    return false;
  }
  return std::prev(it)->second.kind != EventKind::Delete;
}

std::optional<ContentKind> VersionedFile::content_kind_at(Revision revision) const {
  auto it = events_.upper_bound(revision);
  if (it == events_.begin()) {
    return std::nullopt;
  }
  const Event &ev = std::prev(it)->second;
  if (ev.kind == EventKind::Delete) {
    return std::nullopt;
  }
  return ev.content;
}

Text VersionedFile::read_text(const Event &ev) const {
  const auto bytes = fs::read_file(artifact_path(ev));
  auto decoded = text::decode_utf8(bytes);
  if (!decoded) {
    throw Error(ErrorKind::CorruptDelta, "stored text is not UTF-8: " + artifact_path(ev).string());
  }
  return std::move(*decoded);
}

fs::Bytes VersionedFile::contents_at(Revision revision) const {
  auto it = events_.upper_bound(revision);
  if (it == events_.begin()) {
    throw Error(ErrorKind::NotYetPresent,
                name_ + " not present at revision " + rev_str(revision));
  }
  --it;
  const Event &ev = it->second;
  if (ev.kind == EventKind::Delete) {
    throw Error(ErrorKind::DeletedAtRevision,
                name_ + " deleted at revision " + rev_str(ev.revision));
  }
  if (ev.state == EventState::Live || ev.content == ContentKind::Binary) {
    return fs::read_file(artifact_path(ev));
  }

  // Historical text: collect the delta chain up to the next anchor.
  std::vector<Revision> chain{it->first};
  for (auto next = std::next(it); next != events_.end(); ++next) {
    chain.push_back(next->first);
    const Event &n = next->second;
    if (n.state != EventState::Historical || n.content != ContentKind::Text) {
      const std::string out = text::encode_utf8(merge_text_backwards(chain));
      return {out.begin(), out.end()};
    }
  }
  throw Error(ErrorKind::CorruptDelta, "text history of " + name_ + " has no anchor");
}

// `revisions` ascends; the last one is the anchor. A live text anchor holds
// the full newer text and every HT before it is a delta. Any other anchor
// (binary, delete marker) carries no text, so the HT right before it was
// stored verbatim and seeds the buffer instead.
Text VersionedFile::merge_text_backwards(const std::vector<Revision> &revisions) const {
  const Event &anchor = events_.at(revisions.back());
  std::size_t deltas = revisions.size() - 1;
  Text buffer;
  if (anchor.state == EventState::Live && anchor.content == ContentKind::Text) {
    buffer = read_text(anchor);
  } else {
    --deltas;
    buffer = read_text(events_.at(revisions[deltas]));
  }
  for (std::size_t i = deltas; i-- > 0;) {
    const Event &ev = events_.at(revisions[i]);
    const auto raw = fs::read_file(artifact_path(ev));
    const auto d = delta::parse(fs::to_string(raw));
    buffer = delta::apply_delta(buffer, d);
  }
  return buffer;
}

void VersionedFile::write_live(Revision revision, EventKind kind, const fs::Bytes &bytes) {
  const ContentKind content = text::classify(bytes);
  std::string locator = artifact_name(EventState::Live, content, revision, name_);
  const auto path = data_dir_ / locator;
  fs::write_file_atomic(path, bytes);
  fs::sync_mtime(work_path_, path);
  insert_event(Event{.revision = revision,
                     .kind = kind,
                     .state = EventState::Live,
                     .content = content,
                     .locator = std::move(locator)});
  live_ = revision;
}

// Move the live artifact out of the way. Text superseded by text becomes a
// delta "new -> old"; anything else is kept verbatim under its H name.
void VersionedFile::historicize_live(Journal &journal, bool as_delta, const fs::Bytes &new_bytes) {
  Event &old = events_.at(*live_);
  const auto old_path = artifact_path(old);
  journal.backup(old_path);

  std::string hist = artifact_name(EventState::Historical, old.content, old.revision, name_);
  if (as_delta) {
    auto new_text = text::decode_utf8(new_bytes);
    const auto d = delta::compute_delta(*new_text, read_text(old));
    fs::write_file_atomic(data_dir_ / hist, fs::as_bytes(delta::serialize(d)));
    fs::sync_mtime(old_path, data_dir_ / hist);
    fs::remove_file(old_path);
  } else {
    fs::rename(old_path, data_dir_ / hist);
  }
  old.state = EventState::Historical;
  old.locator = std::move(hist);
  live_.reset();
}

ContentKind VersionedFile::create_at_revision(Revision revision, Journal & /*journal*/) {
  if (!events_.empty()) {
    throw Error(ErrorKind::AlreadyHasHistory, name_ + " already has history");
  }
  const auto bytes = fs::read_file(work_path_);
  write_live(revision, EventKind::Create, bytes);
  return events_.at(revision).content;
}

ContentKind VersionedFile::recreate_at_revision(Revision revision, Journal &journal) {
  if (events_.empty()) {
    return create_at_revision(revision, journal);
  }
  if (live_) {
    throw Error(ErrorKind::InvalidEventOrder, name_ + " still exists, cannot recreate");
  }
  if (revision <= last_revision_) {
    throw Error(ErrorKind::InvalidEventOrder, "revision " + rev_str(revision) +
                                                  " not after " + rev_str(last_revision_) +
                                                  " for " + name_);
  }
  const auto bytes = fs::read_file(work_path_);
  write_live(revision, EventKind::Create, bytes);
  return events_.at(revision).content;
}

ContentKind VersionedFile::change_at_revision(Revision revision, Journal &journal) {
  if (!live_) {
    throw Error(ErrorKind::InvalidEventOrder, name_ + " has no live event to supersede");
  }
  if (revision <= last_revision_) {
    throw Error(ErrorKind::InvalidEventOrder, "revision " + rev_str(revision) +
                                                  " not after " + rev_str(last_revision_) +
                                                  " for " + name_);
  }
  const auto bytes = fs::read_file(work_path_);
  const ContentKind old_kind = events_.at(*live_).content;
  const ContentKind new_kind = text::classify(bytes);
  historicize_live(journal, old_kind == ContentKind::Text && new_kind == ContentKind::Text, bytes);
  write_live(revision, EventKind::Modify, bytes);
  return new_kind;
}

void VersionedFile::delete_at_revision(Revision revision, Journal &journal) {
  if (!live_) {
    throw Error(ErrorKind::InvalidEventOrder, name_ + " has no live event to delete");
  }
  if (revision <= last_revision_) {
    throw Error(ErrorKind::InvalidEventOrder, "revision " + rev_str(revision) +
                                                  " not after " + rev_str(last_revision_) +
                                                  " for " + name_);
  }
  historicize_live(journal, false, {});

  // Delete markers are always recorded as binary.
  std::string locator = artifact_name(EventState::Deleted, ContentKind::Binary, revision, name_);
  fs::write_file_atomic(data_dir_ / locator, {});
  insert_event(Event{.revision = revision,
                     .kind = EventKind::Delete,
                     .state = EventState::Deleted,
                     .content = ContentKind::Binary,
                     .locator = std::move(locator)});
}

bool VersionedFile::is_modified() const {
  const auto bytes = fs::try_read_file(work_path_);
  if (!bytes) {
    return false;
  }
  if (!live_) {
    return true;
  }
  const Event &ev = events_.at(*live_);
  if (text::classify(*bytes) != ev.content) {
    return true;
  }
  const auto stored = fs::try_read_file(artifact_path(ev));
  return !stored || *stored != *bytes;
}

} // namespace strata
