#include <wsarrow/record/parser.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <utility>

namespace wsarrow::record {

namespace {

constexpr std::string_view kAssociationsWrapper = "associations";
constexpr std::string_view kItemValueField = "value";

// ─── Byte-level checks ───────────────────────────────────────────────────────

auto valid_entity(std::string_view name) -> bool {
    if (name == "amp" || name == "lt" || name == "gt" || name == "quot" || name == "apos") {
        return true;
    }
    if (name.size() < 2 || name.front() != '#') {
        return false;
    }
    if (name[1] == 'x' || name[1] == 'X') {
        auto digits = name.substr(2);
        return !digits.empty() && std::ranges::all_of(digits, [](char ch) {
            return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
        });
    }
    return std::ranges::all_of(name.substr(1), [](char ch) { return ch >= '0' && ch <= '9'; });
}

/// First malformed entity reference outside CDATA sections and comments.
auto find_bad_entity(std::string_view bytes) -> std::optional<std::size_t> {
    constexpr std::string_view kCdataOpen = "<![CDATA[";
    constexpr std::string_view kCommentOpen = "<!--";
    std::size_t i = 0;
    while (i < bytes.size()) {
        if (bytes.substr(i, kCdataOpen.size()) == kCdataOpen) {
            auto end = bytes.find("]]>", i + kCdataOpen.size());
            if (end == std::string_view::npos) {
                return i;
            }
            i = end + 3;
            continue;
        }
        if (bytes.substr(i, kCommentOpen.size()) == kCommentOpen) {
            auto end = bytes.find("-->", i + kCommentOpen.size());
            if (end == std::string_view::npos) {
                return i;
            }
            i = end + 3;
            continue;
        }
        if (bytes[i] == '&') {
            auto semi = bytes.find(';', i + 1);
            if (semi == std::string_view::npos || semi - i > 12 ||
                !valid_entity(bytes.substr(i + 1, semi - i - 1))) {
                return i;
            }
            i = semi + 1;
            continue;
        }
        ++i;
    }
    return std::nullopt;
}

/// Byte offset of the start of 1-based `line`.
auto line_offset(std::string_view bytes, int line) -> std::size_t {
    std::size_t offset = 0;
    for (int current = 1; current < line; ++current) {
        auto nl = bytes.find('\n', offset);
        if (nl == std::string_view::npos) {
            break;
        }
        offset = nl + 1;
    }
    return offset;
}

// ─── XML ─────────────────────────────────────────────────────────────────────

class XmlPageReader {
   public:
    explicit XmlPageReader(std::string_view bytes) : bytes_(bytes) {}

    auto read(const Schema& schema) -> Result<std::vector<RecordTree>> {
        if (auto bad = find_bad_entity(bytes_)) {
            return std::unexpected(parse_error("invalid entity or unterminated section", *bad));
        }
        tinyxml2::XMLDocument doc;
        if (auto rc = doc.Parse(bytes_.data(), bytes_.size()); rc != tinyxml2::XML_SUCCESS) {
            return std::unexpected(parse_error(
                fmt::format("malformed XML [{}]: {}", tinyxml2::XMLDocument::ErrorIDToName(rc),
                            doc.ErrorStr() != nullptr ? doc.ErrorStr() : ""),
                line_offset(bytes_, doc.ErrorLineNum())));
        }
        const auto* root = doc.RootElement();
        if (root == nullptr) {
            return std::unexpected(parse_error("document has no root element", 0));
        }
        std::vector<RecordTree> records;
        const auto* container = root->FirstChildElement();
        if (container == nullptr) {
            return records;
        }
        for (const auto* el = container->FirstChildElement(); el != nullptr;
             el = el->NextSiblingElement()) {
            RecordTree record;
            if (auto ok = read_record(*el, &schema, record); !ok) {
                return std::unexpected(ok.error());
            }
            records.push_back(std::move(record));
        }
        return records;
    }

   private:
    [[nodiscard]] auto offset_of(const tinyxml2::XMLElement& el) const -> std::size_t {
        return line_offset(bytes_, el.GetLineNum());
    }

    static auto text_of(const tinyxml2::XMLElement& el) -> std::string {
        const char* text = el.GetText();
        return text != nullptr ? std::string(text) : std::string{};
    }

    static auto is_leaf(const tinyxml2::XMLElement& el) -> bool {
        return el.FirstChildElement() == nullptr;
    }

    /// Repeated same-named children or an explicit nodeType mark a list.
    static auto looks_like_list(const tinyxml2::XMLElement& el) -> bool {
        if (el.Attribute("nodeType") != nullptr) {
            return true;
        }
        const auto* first = el.FirstChildElement();
        if (first == nullptr || first->NextSiblingElement() == nullptr) {
            return false;
        }
        for (const auto* child = first->NextSiblingElement(); child != nullptr;
             child = child->NextSiblingElement()) {
            if (std::string_view(child->Name()) != first->Name()) {
                return false;
            }
        }
        return true;
    }

    auto read_record(const tinyxml2::XMLElement& el, const Schema* schema, RecordTree& out)
        -> Result<void> {
        for (const auto* child = el.FirstChildElement(); child != nullptr;
             child = child->NextSiblingElement()) {
            std::string name = child->Name();
            const FieldSpec* field = schema != nullptr ? schema->find(name) : nullptr;
            if (field == nullptr && name == kAssociationsWrapper) {
                if (auto ok = read_record(*child, schema, out); !ok) {
                    return ok;
                }
                continue;
            }
            RecordTree::Value value;
            if (field != nullptr && field->is_association()) {
                auto items = read_list(*child, field->association()->element.get());
                if (!items) {
                    return std::unexpected(items.error());
                }
                value = std::move(*items);
            } else if (is_leaf(*child)) {
                value = text_of(*child);
            } else {
                auto nested = read_untyped(*child);
                if (!nested) {
                    return std::unexpected(nested.error());
                }
                value = std::move(*nested);
            }
            if (!out.set(name, std::move(value))) {
                return std::unexpected(parse_error(
                    fmt::format("duplicate element <{}> in <{}>", name, el.Name()), offset_of(*child)));
            }
        }
        return {};
    }

    auto read_list(const tinyxml2::XMLElement& el, const Schema* element)
        -> Result<RecordTree::List> {
        RecordTree::List items;
        for (const auto* item = el.FirstChildElement(); item != nullptr;
             item = item->NextSiblingElement()) {
            RecordTree record;
            for (const auto* attr = item->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
                record.set_text(attr->Name(), attr->Value());
            }
            if (is_leaf(*item)) {
                if (!record.set_text(std::string(kItemValueField), text_of(*item))) {
                    return std::unexpected(parse_error(
                        fmt::format("list item <{}> has both a value attribute and text", item->Name()),
                        offset_of(*item)));
                }
            } else if (auto ok = read_record(*item, element, record); !ok) {
                return std::unexpected(ok.error());
            }
            items.push_back(std::move(record));
        }
        return items;
    }

    auto read_untyped(const tinyxml2::XMLElement& el) -> Result<RecordTree::Value> {
        if (looks_like_list(el)) {
            auto items = read_list(el, nullptr);
            if (!items) {
                return std::unexpected(items.error());
            }
            return RecordTree::Value{std::move(*items)};
        }
        auto nested = std::make_shared<RecordTree>();
        if (auto ok = read_record(el, nullptr, *nested); !ok) {
            return std::unexpected(ok.error());
        }
        return RecordTree::Value{RecordTree::Nested{std::move(nested)}};
    }

    std::string_view bytes_;
};

// ─── JSON ────────────────────────────────────────────────────────────────────

auto json_text(const nlohmann::json& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

auto read_json_record(const nlohmann::json& object, const Schema* schema, RecordTree& out)
    -> Result<void>;

auto read_json_value(const nlohmann::json& value, const Schema* element)
    -> Result<RecordTree::Value> {
    if (value.is_null()) {
        return RecordTree::Value{RecordTree::Null{}};
    }
    if (value.is_array()) {
        RecordTree::List items;
        items.reserve(value.size());
        for (const auto& item : value) {
            RecordTree record;
            if (item.is_object()) {
                if (auto ok = read_json_record(item, element, record); !ok) {
                    return std::unexpected(ok.error());
                }
            } else if (!item.is_null()) {
                record.set_text(std::string(kItemValueField), json_text(item));
            }
            items.push_back(std::move(record));
        }
        return RecordTree::Value{std::move(items)};
    }
    if (value.is_object()) {
        auto nested = std::make_shared<RecordTree>();
        if (auto ok = read_json_record(value, element, *nested); !ok) {
            return std::unexpected(ok.error());
        }
        return RecordTree::Value{RecordTree::Nested{std::move(nested)}};
    }
    return RecordTree::Value{json_text(value)};
}

auto read_json_record(const nlohmann::json& object, const Schema* schema, RecordTree& out)
    -> Result<void> {
    for (const auto& [key, value] : object.items()) {
        const FieldSpec* field = schema != nullptr ? schema->find(key) : nullptr;
        if (field == nullptr && key == kAssociationsWrapper && value.is_object()) {
            if (auto ok = read_json_record(value, schema, out); !ok) {
                return ok;
            }
            continue;
        }
        const Schema* element = nullptr;
        if (field != nullptr && field->is_association()) {
            element = field->association()->element.get();
        }
        auto converted = read_json_value(value, element);
        if (!converted) {
            return std::unexpected(converted.error());
        }
        if (!out.set(key, std::move(*converted))) {
            return std::unexpected(parse_error(fmt::format("duplicate key '{}'", key), 0));
        }
    }
    return {};
}

auto read_json_page(std::string_view bytes, const Schema& schema)
    -> Result<std::vector<RecordTree>> {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(parse_error(fmt::format("malformed JSON: {}", e.what()),
                                           e.byte > 0 ? e.byte - 1 : 0));
    }

    const nlohmann::json* listing = nullptr;
    if (doc.is_array()) {
        listing = &doc;
    } else if (doc.is_object()) {
        if (doc.empty()) {
            return std::vector<RecordTree>{};
        }
        if (doc.size() != 1 || !doc.begin().value().is_array()) {
            return std::unexpected(
                parse_error("expected a single member holding the record array", 0));
        }
        listing = &doc.begin().value();
    } else {
        return std::unexpected(parse_error("page is neither an object nor an array", 0));
    }

    std::vector<RecordTree> records;
    records.reserve(listing->size());
    for (const auto& item : *listing) {
        if (!item.is_object()) {
            return std::unexpected(
                parse_error(fmt::format("record {} is not an object", records.size()), 0));
        }
        RecordTree record;
        if (auto ok = read_json_record(item, &schema, record); !ok) {
            return std::unexpected(ok.error());
        }
        records.push_back(std::move(record));
    }
    return records;
}

}  // namespace

auto to_string(WireFormat format) noexcept -> std::string_view {
    switch (format) {
        case WireFormat::Xml:
            return "xml";
        case WireFormat::Json:
            return "json";
    }
    return "unknown";
}

auto parse_wire_format(std::string_view name) -> std::optional<WireFormat> {
    if (name == "xml") {
        return WireFormat::Xml;
    }
    if (name == "json") {
        return WireFormat::Json;
    }
    return std::nullopt;
}

auto find_invalid_utf8(std::string_view bytes) noexcept -> std::optional<std::size_t> {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return i;
        }
        if (i + len > bytes.size()) {
            return i;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return i;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return i;
        }
        i += len;
    }
    return std::nullopt;
}

auto parse_page(std::string_view bytes, WireFormat format, const Schema& schema)
    -> Result<std::vector<RecordTree>> {
    if (auto bad = find_invalid_utf8(bytes)) {
        return std::unexpected(parse_error("invalid UTF-8 byte sequence", *bad));
    }
    auto records = format == WireFormat::Xml ? XmlPageReader(bytes).read(schema)
                                             : read_json_page(bytes, schema);
    if (records) {
        spdlog::debug("parsed {} records from {} byte {} page", records->size(), bytes.size(),
                      to_string(format));
    }
    return records;
}

}  // namespace wsarrow::record
