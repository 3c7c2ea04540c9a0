#include "descriptor_writer.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "internal/pbxproj/plist_parser.hpp"
#include "internal/pbxproj/string_encoding.hpp"

namespace pbxpatch::pbxproj {

using namespace pbxpatch::model;

namespace {

struct Insertion {
  std::size_t offset;
  std::string text;
};

bool IsBlank(std::string_view text) {
  return text.find_first_not_of(" \t") == std::string_view::npos;
}

std::string CommentFor(const Descriptor& descriptor, const ObjectId& id) {
  if (const auto* ref = descriptor.FileReferences().Find(id)) return ref->DisplayName();
  if (const auto* group = descriptor.Groups().Find(id)) return group->DisplayName();
  if (const auto* file = descriptor.BuildFiles().Find(id)) return file->display_name;
  return {};
}

// "ID /* comment */", or the bare id when there is nothing to say.
std::string Reference(const Descriptor& descriptor, const ObjectId& id) {
  auto comment = CommentFor(descriptor, id);
  return comment.empty() ? id : id + " /* " + comment + " */";
}

std::string RenderFileReference(const FileReference& ref, const std::string& indent) {
  std::ostringstream out;
  out << indent << ref.id << " /* " << ref.DisplayName() << " */ = {isa = PBXFileReference; ";
  if (!ref.file_type.empty()) out << "lastKnownFileType = " << EncodeString(ref.file_type) << "; ";
  if (!ref.name.empty()) out << "name = " << EncodeString(ref.name) << "; ";
  out << "path = " << EncodeString(ref.path) << "; ";
  out << "sourceTree = " << EncodeString(ref.source_tree) << "; };\n";
  return out.str();
}

std::string RenderBuildFile(const Descriptor& descriptor, const BuildFile& file, const std::string& indent) {
  std::ostringstream out;
  out << indent << file.id << " /* " << file.display_name << " */ = {isa = PBXBuildFile; ";
  if (file.file_ref) out << "fileRef = " << Reference(descriptor, *file.file_ref) << "; ";
  out << "};\n";
  return out.str();
}

std::string RenderGroup(const Descriptor& descriptor, const Group& group, const std::string& indent) {
  std::ostringstream out;
  out << indent << group.id << " /* " << group.DisplayName() << " */ = {\n";
  out << indent << "\tisa = " << group.isa << ";\n";
  out << indent << "\tchildren = (\n";
  for (const auto& child : group.children.ids)
    out << indent << "\t\t" << Reference(descriptor, child) << ",\n";
  out << indent << "\t);\n";
  if (!group.name.empty()) out << indent << "\tname = " << EncodeString(group.name) << ";\n";
  if (!group.path.empty()) out << indent << "\tpath = " << EncodeString(group.path) << ";\n";
  out << indent << "\tsourceTree = " << EncodeString(group.source_tree) << ";\n";
  out << indent << "};\n";
  return out.str();
}

/*
  Offset right after the last list item (and its comment) before `close`,
  if that item is not already followed by a comma.
*/
std::optional<std::size_t> MissingSeparator(std::string_view text, std::size_t close) {
  std::optional<std::size_t> content_end;
  std::size_t                pos = close;
  while (pos > 0) {
    const char c = text[pos - 1];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      --pos;
      continue;
    }
    if (!content_end) content_end = pos;
    if (c == '/' && pos >= 2 && text[pos - 2] == '*') {
      const auto open = text.rfind("/*", pos - 2);
      if (open == std::string_view::npos) break;
      pos = open;
      continue;
    }
    if (c == ',' || c == '(') return std::nullopt;
    return content_end;
  }
  return std::nullopt;
}

void AppendListEntries(std::vector<Insertion>& insertions, const Descriptor& descriptor, const IdList& list) {
  if (!list.HasAppended()) return;
  if (list.close_offset == kNoOffset) throw std::logic_error("list entries appended to a list that is not in the descriptor text");

  const std::string_view text = descriptor.Text();

  if (auto separator = MissingSeparator(text, list.close_offset)) insertions.push_back({*separator, ","});

  const auto line_start = LineStart(text, list.close_offset);
  const auto lead       = text.substr(line_start, list.close_offset - line_start);

  std::string entries;
  if (IsBlank(lead)) {
    for (auto i = list.original_size; i < list.ids.size(); ++i)
      entries += std::string(lead) + "\t" + Reference(descriptor, list.ids[i]) + ",\n";
    insertions.push_back({line_start, std::move(entries)});
    return;
  }

  // Single-line list: "children = (A, B, );"
  if (list.close_offset > 0 && !IsBlank(text.substr(list.close_offset - 1, 1))) entries = " ";
  for (auto i = list.original_size; i < list.ids.size(); ++i)
    entries += Reference(descriptor, list.ids[i]) + ", ";
  insertions.push_back({list.close_offset, std::move(entries)});
}

void AppendRecord(std::vector<Insertion>& insertions, const Descriptor& descriptor, const std::string& isa, const std::string& rendered) {
  const auto* section = descriptor.FindSection(isa);
  if (!section) throw std::logic_error("descriptor has no " + isa + " section to hold a new record");

  const std::string_view text = descriptor.Text();

  const auto line_start = LineStart(text, section->end_marker);
  if (IsBlank(text.substr(line_start, section->end_marker - line_start))) {
    insertions.push_back({line_start, rendered});
  } else {
    insertions.push_back({section->end_marker, "\n" + rendered});
  }
}

} // namespace

std::string DescriptorWriter::Write(const Descriptor& descriptor) {
  if (!descriptor.HasChanges()) return descriptor.Text();

  std::vector<Insertion> insertions;

  for (const auto& id : descriptor.AddedObjects()) {
    if (const auto* ref = descriptor.FileReferences().Find(id)) {
      const auto* section = descriptor.FindSection("PBXFileReference");
      AppendRecord(insertions, descriptor, "PBXFileReference", RenderFileReference(*ref, section ? section->record_indent : "\t\t"));
    } else if (const auto* file = descriptor.BuildFiles().Find(id)) {
      const auto* section = descriptor.FindSection("PBXBuildFile");
      AppendRecord(insertions, descriptor, "PBXBuildFile", RenderBuildFile(descriptor, *file, section ? section->record_indent : "\t\t"));
    } else if (const auto* group = descriptor.Groups().Find(id)) {
      const auto* section = descriptor.FindSection(group->isa);
      AppendRecord(insertions, descriptor, group->isa, RenderGroup(descriptor, *group, section ? section->record_indent : "\t\t"));
    }
  }

  for (const auto& group : descriptor.Groups().All()) {
    if (!group.added) AppendListEntries(insertions, descriptor, group.children);
  }
  for (const auto& phase : descriptor.BuildPhases().All())
    AppendListEntries(insertions, descriptor, phase.files);

  std::stable_sort(insertions.begin(), insertions.end(), [](const Insertion& a, const Insertion& b) { return a.offset < b.offset; });

  const auto& text = descriptor.Text();

  std::string out;
  out.reserve(text.size() + 256 * insertions.size());

  std::size_t cursor = 0;
  for (const auto& insertion : insertions) {
    out.append(text, cursor, insertion.offset - cursor);
    out += insertion.text;
    cursor = insertion.offset;
  }
  out.append(text, cursor, std::string::npos);
  return out;
}

} // namespace pbxpatch::pbxproj
