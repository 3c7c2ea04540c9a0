#include "descriptor_reader.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

#include "internal/pbxproj/plist_parser.hpp"
#include "internal/util/errors.hpp"

namespace pbxpatch::pbxproj {

using namespace pbxpatch::model;

namespace {

constexpr std::string_view kBeginPrefix   = "/* Begin ";
constexpr std::string_view kEndPrefix     = "/* End ";
constexpr std::string_view kSectionSuffix = " section */";

constexpr std::array<std::string_view, 4> kRequiredSections = {
    "PBXBuildFile",
    "PBXFileReference",
    "PBXGroup",
    "PBXSourcesBuildPhase",
};

bool IsGroupIsa(std::string_view isa) {
  return isa == "PBXGroup" || isa == "PBXVariantGroup" || isa == "XCVersionGroup";
}

bool IsBuildPhaseIsa(std::string_view isa) {
  return isa.starts_with("PBX") && isa.ends_with("BuildPhase");
}

ObjectKind KindOf(std::string_view isa) {
  if (isa == "PBXFileReference" || isa == "PBXReferenceProxy") return ObjectKind::kFileReference;
  if (isa == "PBXBuildFile") return ObjectKind::kBuildFile;
  if (IsGroupIsa(isa)) return ObjectKind::kGroup;
  if (IsBuildPhaseIsa(isa)) return ObjectKind::kBuildPhase;
  if (isa == "PBXNativeTarget") return ObjectKind::kNativeTarget;
  if (isa == "PBXProject") return ObjectKind::kProject;
  return ObjectKind::kOther;
}

[[noreturn]] void Fail(std::string_view text, std::size_t offset, const std::string& what) {
  throw util::MalformedDescriptor("line " + std::to_string(LineNumber(text, offset)) + ": " + what);
}

std::vector<Section> LocateSections(std::string_view text) {
  std::vector<Section> sections;

  std::size_t cursor = 0;
  while (true) {
    const auto begin = text.find(kBeginPrefix, cursor);
    if (begin == std::string_view::npos) break;

    const auto name_begin = begin + kBeginPrefix.size();
    const auto suffix     = text.find(kSectionSuffix, name_begin);
    const auto line_end   = text.find('\n', begin);
    if (suffix == std::string_view::npos || (line_end != std::string_view::npos && suffix > line_end)) {
      Fail(text, begin, "unterminated section marker");
    }

    Section section;
    section.isa        = std::string(text.substr(name_begin, suffix - name_begin));
    section.body_begin = suffix + kSectionSuffix.size();

    const auto end_marker = std::string(kEndPrefix) + section.isa + std::string(kSectionSuffix);
    const auto end        = text.find(end_marker, section.body_begin);
    if (end == std::string_view::npos) Fail(text, begin, "section " + section.isa + " has no end marker");

    const auto nested = text.find(kBeginPrefix, section.body_begin);
    if (nested != std::string_view::npos && nested < end) Fail(text, nested, "section begins inside section " + section.isa);

    section.end_marker = end;
    sections.push_back(std::move(section));
    cursor = end + end_marker.size();
  }

  return sections;
}

IdList ToIdList(std::string_view text, const PlistObject& object, const char* key) {
  IdList list;

  const auto* value = object.body.Find(key);
  if (!value) return list;
  if (value->kind != PlistValue::Kind::kArray) Fail(text, value->begin, std::string(key) + " of " + object.id + " is not a list");

  for (const auto& item : value->items) {
    if (item.kind != PlistValue::Kind::kString) Fail(text, item.begin, std::string(key) + " of " + object.id + " holds a non-identifier");
    list.ids.push_back(item.string);
  }
  list.original_size = list.ids.size();
  list.close_offset  = value->end;
  return list;
}

void Populate(Descriptor& descriptor, std::string_view text, const PlistObject& object, const std::string& isa) {
  const auto& body = object.body;

  if (isa == "PBXFileReference") {
    FileReference ref;
    ref.id          = object.id;
    ref.name        = body.StringOr("name");
    ref.file_type   = body.StringOr("lastKnownFileType", body.StringOr("explicitFileType"));
    ref.path        = body.StringOr("path");
    ref.source_tree = body.StringOr("sourceTree");
    descriptor.PutFileReference(std::move(ref));
    return;
  }

  if (isa == "PBXBuildFile") {
    BuildFile file;
    file.id           = object.id;
    file.display_name = object.comment;
    if (const auto* ref = body.Find("fileRef")) {
      if (ref->kind != PlistValue::Kind::kString) Fail(text, ref->begin, "fileRef of " + object.id + " is not an identifier");
      file.file_ref = ref->string;
    }
    descriptor.PutBuildFile(std::move(file));
    return;
  }

  if (IsGroupIsa(isa)) {
    Group group;
    group.id          = object.id;
    group.isa         = isa;
    group.name        = body.StringOr("name");
    group.path        = body.StringOr("path");
    group.source_tree = body.StringOr("sourceTree");
    group.children    = ToIdList(text, object, "children");
    descriptor.PutGroup(std::move(group));
    return;
  }

  if (IsBuildPhaseIsa(isa)) {
    BuildPhase phase;
    phase.id    = object.id;
    phase.isa   = isa;
    phase.name  = body.StringOr("name", object.comment);
    phase.files = ToIdList(text, object, "files");
    descriptor.PutBuildPhase(std::move(phase));
    return;
  }

  if (isa == "PBXNativeTarget") {
    NativeTarget target;
    target.id           = object.id;
    target.name         = body.StringOr("name");
    target.build_phases = ToIdList(text, object, "buildPhases").ids;
    descriptor.PutNativeTarget(std::move(target));
    return;
  }

  if (isa == "PBXProject") {
    descriptor.SetMainGroup(body.StringOr("mainGroup"));
  }
}

} // namespace

Descriptor DescriptorReader::Read(std::string text) {
  auto sections = LocateSections(text);

  for (auto required : kRequiredSections) {
    const bool found = std::any_of(sections.begin(), sections.end(), [&](const Section& s) { return s.isa == required; });
    if (!found) throw util::MalformedDescriptor("descriptor has no " + std::string(required) + " section");
  }

  Descriptor descriptor(std::move(text));
  const std::string_view view = descriptor.Text();

  for (auto& section : sections) {
    PlistParser parser(PlistLexer(view, section.body_begin, section.end_marker));

    bool first = true;
    while (auto object = parser.NextObject()) {
      if (first) {
        const auto line_start = LineStart(view, object->begin);
        const auto indent     = view.substr(line_start, object->begin - line_start);
        if (indent.find_first_not_of(" \t") == std::string_view::npos) section.record_indent = std::string(indent);
        first = false;
      }

      const auto isa = object->body.StringOr("isa");
      if (isa.empty()) Fail(view, object->begin, "object " + object->id + " has no isa");
      if (!descriptor.IndexObject(object->id, isa, KindOf(isa))) Fail(view, object->begin, "duplicate object id " + object->id);

      Populate(descriptor, view, *object, isa);
    }

    descriptor.AddSection(std::move(section));
  }

  return descriptor;
}

} // namespace pbxpatch::pbxproj
