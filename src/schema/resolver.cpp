#include <wsarrow/schema/resolver.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include <array>
#include <memory>
#include <utility>

namespace wsarrow::schema {

namespace {

struct HintEntry {
    std::string_view hint;
    ScalarKind kind;
};

// clang-format off
constexpr std::array kHintTable = {
    HintEntry{"isBool", ScalarKind::Boolean},

    HintEntry{"isUnsignedId", ScalarKind::Integer},
    HintEntry{"isNullOrUnsignedId", ScalarKind::Integer},
    HintEntry{"isUnsignedInt", ScalarKind::Integer},
    HintEntry{"isInt", ScalarKind::Integer},

    HintEntry{"isFloat", ScalarKind::Decimal},
    HintEntry{"isUnsignedFloat", ScalarKind::Decimal},
    HintEntry{"isPrice", ScalarKind::Decimal},
    HintEntry{"isNegativePrice", ScalarKind::Decimal},
    HintEntry{"isPercentage", ScalarKind::Decimal},
    HintEntry{"isCoordinate", ScalarKind::Decimal},

    HintEntry{"isDate", ScalarKind::DateTime},
    HintEntry{"isDateOrNull", ScalarKind::DateTime},
    HintEntry{"isBirthDate", ScalarKind::Date},

    HintEntry{"isCleanHtml", ScalarKind::HtmlText},

    HintEntry{"isString", ScalarKind::Text},
    HintEntry{"isGenericName", ScalarKind::Text},
    HintEntry{"isCatalogName", ScalarKind::Text},
    HintEntry{"isName", ScalarKind::Text},
    HintEntry{"isLinkRewrite", ScalarKind::Text},
    HintEntry{"isReference", ScalarKind::Text},
    HintEntry{"isEan13", ScalarKind::Text},
    HintEntry{"isUpc", ScalarKind::Text},
    HintEntry{"isIsbn", ScalarKind::Text},
    HintEntry{"isMpn", ScalarKind::Text},
    HintEntry{"isEmail", ScalarKind::Text},
    HintEntry{"isUrl", ScalarKind::Text},
    HintEntry{"isAbsoluteUrl", ScalarKind::Text},
    HintEntry{"isDateFormat", ScalarKind::Text},
    HintEntry{"isPhpDateFormat", ScalarKind::Text},
    HintEntry{"isColor", ScalarKind::Text},
    HintEntry{"isAddress", ScalarKind::Text},
    HintEntry{"isCityName", ScalarKind::Text},
    HintEntry{"isPostCode", ScalarKind::Text},
    HintEntry{"isPhoneNumber", ScalarKind::Text},
    HintEntry{"isMessage", ScalarKind::Text},
    HintEntry{"isLanguageIsoCode", ScalarKind::Text},
    HintEntry{"isLanguageCode", ScalarKind::Text},
    HintEntry{"isStateIsoCode", ScalarKind::Text},
    HintEntry{"isZipCodeFormat", ScalarKind::Text},
    HintEntry{"isDniLite", ScalarKind::Text},
    HintEntry{"isMd5", ScalarKind::Text},
    HintEntry{"isSha1", ScalarKind::Text},
    HintEntry{"isPasswd", ScalarKind::Text},
    HintEntry{"isPasswdAdmin", ScalarKind::Text},
    HintEntry{"isIp2Long", ScalarKind::Text},
    HintEntry{"isProductVisibility", ScalarKind::Text},
    HintEntry{"isReductionType", ScalarKind::Text},
    HintEntry{"isPriceDisplayMethod", ScalarKind::Text},
    HintEntry{"isTrackingNumber", ScalarKind::Text},
    HintEntry{"isThemeName", ScalarKind::Text},
    HintEntry{"isTplName", ScalarKind::Text},
    HintEntry{"isModuleName", ScalarKind::Text},
    HintEntry{"isConfigName", ScalarKind::Text},
    HintEntry{"isCustomerName", ScalarKind::Text},
    HintEntry{"isCarrierName", ScalarKind::Text},
    HintEntry{"isImageTypeName", ScalarKind::Text},
    HintEntry{"isImageSize", ScalarKind::Text},
    HintEntry{"isLocale", ScalarKind::Text},
    HintEntry{"isJson", ScalarKind::Text},
    HintEntry{"isSerializedArray", ScalarKind::Text},
    HintEntry{"isAnything", ScalarKind::Text},
    HintEntry{"isApe", ScalarKind::Text},
    HintEntry{"isStockManagement", ScalarKind::Text},
    HintEntry{"isNumericIsoCode", ScalarKind::Text},
    HintEntry{"isTabName", ScalarKind::Text},
    HintEntry{"isSearchEngine", ScalarKind::Text},
    HintEntry{"isWeightUnit", ScalarKind::Text},
    HintEntry{"isDistanceUnit", ScalarKind::Text},
    HintEntry{"isVolumeUnit", ScalarKind::Text},
    HintEntry{"isDimensionUnit", ScalarKind::Text},
};
// clang-format on

constexpr std::string_view kAssociations = "associations";
constexpr std::string_view kLanguage = "language";

/// Walks one synopsis document. Keeps the options and resource name for
/// error context.
class SynopsisReader {
   public:
    SynopsisReader(std::string_view resource, const ResolveOptions& options)
        : resource_(resource), options_(options) {}

    auto read_fields(const tinyxml2::XMLElement& parent) -> Result<std::vector<FieldSpec>> {
        std::vector<FieldSpec> fields;
        for (const auto* el = parent.FirstChildElement(); el != nullptr;
             el = el->NextSiblingElement()) {
            if (std::string_view(el->Name()) == kAssociations) {
                for (const auto* assoc = el->FirstChildElement(); assoc != nullptr;
                     assoc = assoc->NextSiblingElement()) {
                    auto field = read_association(*assoc);
                    if (!field) {
                        return std::unexpected(field.error());
                    }
                    fields.push_back(std::move(*field));
                }
                continue;
            }
            auto field = read_field(*el);
            if (!field) {
                return std::unexpected(field.error());
            }
            fields.push_back(std::move(*field));
        }
        return fields;
    }

   private:
    auto scalar_kind(const tinyxml2::XMLElement& el) -> Result<ScalarKind> {
        std::string_view name = el.Name();
        if (const char* hint = el.Attribute("format")) {
            if (auto kind = kind_for_hint(hint)) {
                return *kind;
            }
            if (options_.unknown_hints == UnknownHintPolicy::Reject) {
                return std::unexpected(
                    schema_error(fmt::format("unknown format hint '{}'", hint), std::string(name)));
            }
            spdlog::warn("{}: unknown format hint '{}' on field '{}', using nullable Text",
                         resource_, hint, name);
            return ScalarKind::Text;
        }
        if (auto kind = kind_for_name(name)) {
            spdlog::warn("{}: assuming field '{}' is Integer from its name", resource_, name);
            return *kind;
        }
        return ScalarKind::Text;
    }

    static auto is_translated(const tinyxml2::XMLElement& el) -> bool {
        const auto* first = el.FirstChildElement();
        return first != nullptr && std::string_view(first->Name()) == kLanguage &&
               first->Attribute("id") != nullptr;
    }

    auto read_field(const tinyxml2::XMLElement& el) -> Result<FieldSpec> {
        std::string name = el.Name();
        if (el.Attribute("nodeType") != nullptr) {
            return read_association(el);
        }
        auto kind = scalar_kind(el);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        // The synopsis only says "required"; an unknown hint always stays nullable.
        const bool known = el.Attribute("format") == nullptr ||
                           kind_for_hint(el.Attribute("format")).has_value();
        const bool nullable = !el.BoolAttribute("required", false) || !known;

        if (is_translated(el)) {
            auto element = Schema::make({
                FieldSpec{.name = std::string(kLanguageIdField),
                          .kind = ScalarKind::Integer,
                          .nullable = false},
                FieldSpec{.name = std::string(kLanguageValueField), .kind = *kind, .nullable = true},
            });
            if (!element) {
                return std::unexpected(element.error());
            }
            return FieldSpec{
                .name = std::move(name),
                .kind = AssociationKind{.element = std::make_shared<const Schema>(std::move(*element)),
                                        .translated = true},
                .nullable = true};
        }
        if (el.FirstChildElement() != nullptr) {
            return std::unexpected(schema_error(
                fmt::format("field '{}' has child elements but is neither translated nor an "
                            "association",
                            name),
                name));
        }
        return FieldSpec{.name = std::move(name), .kind = *kind, .nullable = nullable};
    }

    auto read_association(const tinyxml2::XMLElement& el) -> Result<FieldSpec> {
        std::string name = el.Name();
        const auto* item = el.FirstChildElement();
        if (item == nullptr) {
            return std::unexpected(
                schema_error(fmt::format("association '{}' has no element template", name), name));
        }
        if (item->NextSiblingElement() != nullptr) {
            return std::unexpected(schema_error(
                fmt::format("association '{}' has more than one element template", name), name));
        }
        std::vector<FieldSpec> fields;
        if (item->FirstChildElement() == nullptr) {
            fields.push_back(FieldSpec{.name = std::string(kLanguageValueField),
                                       .kind = ScalarKind::Text});
        } else {
            auto read = read_fields(*item);
            if (!read) {
                return std::unexpected(read.error());
            }
            fields = std::move(*read);
        }
        auto element = Schema::make(std::move(fields));
        if (!element) {
            return std::unexpected(element.error());
        }
        return FieldSpec{
            .name = std::move(name),
            .kind = AssociationKind{.element = std::make_shared<const Schema>(std::move(*element))},
            .nullable = true};
    }

    std::string_view resource_;
    const ResolveOptions& options_;
};

auto parse_document(tinyxml2::XMLDocument& doc, std::string_view bytes) -> Result<void> {
    if (auto rc = doc.Parse(bytes.data(), bytes.size()); rc != tinyxml2::XML_SUCCESS) {
        return std::unexpected(schema_error(
            fmt::format("malformed schema document [{}] at line {}: {}",
                        tinyxml2::XMLDocument::ErrorIDToName(rc), doc.ErrorLineNum(),
                        doc.ErrorStr() != nullptr ? doc.ErrorStr() : "")));
    }
    if (doc.RootElement() == nullptr) {
        return std::unexpected(schema_error("schema document has no root element"));
    }
    return {};
}

}  // namespace

auto kind_for_hint(std::string_view hint) -> std::optional<ScalarKind> {
    for (const auto& entry : kHintTable) {
        if (entry.hint == hint) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

auto kind_for_name(std::string_view name) -> std::optional<ScalarKind> {
    if (name == "id" || name.starts_with("id_") || name.ends_with("_id")) {
        return ScalarKind::Integer;
    }
    return std::nullopt;
}

auto resolve_schema(std::string_view resource, std::string_view bytes, const ResolveOptions& options)
    -> Result<Schema> {
    tinyxml2::XMLDocument doc;
    if (auto ok = parse_document(doc, bytes); !ok) {
        return std::unexpected(std::move(ok.error()).with_resource(std::string(resource)));
    }
    const auto* record = doc.RootElement()->FirstChildElement();
    if (record == nullptr) {
        return std::unexpected(schema_error("schema document has no resource element")
                                   .with_resource(std::string(resource)));
    }

    SynopsisReader reader(resource, options);
    auto fields = reader.read_fields(*record);
    if (!fields) {
        return std::unexpected(std::move(fields.error()).with_resource(std::string(resource)));
    }

    // The record identifier leads every schema, whether or not the synopsis lists it.
    FieldSpec id{.name = std::string(kIdField), .kind = ScalarKind::Integer, .nullable = false};
    std::erase_if(*fields, [](const FieldSpec& field) { return field.name == kIdField; });
    fields->insert(fields->begin(), std::move(id));

    auto schema = Schema::make(std::move(*fields));
    if (!schema) {
        return std::unexpected(std::move(schema.error()).with_resource(std::string(resource)));
    }
    spdlog::debug("{}: resolved {} fields (association depth {})", resource, schema->size(),
                  schema->depth());
    return schema;
}

auto collapse_translations(const Schema& schema) -> Result<Schema> {
    std::vector<FieldSpec> fields;
    fields.reserve(schema.size());
    for (const auto& field : schema.fields()) {
        const auto* assoc = field.association();
        if (assoc == nullptr) {
            fields.push_back(field);
            continue;
        }
        if (assoc->translated) {
            const auto* value = assoc->element->find(kLanguageValueField);
            if (value == nullptr || value->is_association()) {
                return std::unexpected(schema_error(
                    fmt::format("translated field '{}' has no scalar value", field.name),
                    field.name));
            }
            fields.push_back(
                FieldSpec{.name = field.name, .kind = *value->scalar_kind(), .nullable = true});
            continue;
        }
        auto element = collapse_translations(*assoc->element);
        if (!element) {
            return std::unexpected(element.error());
        }
        fields.push_back(FieldSpec{
            .name = field.name,
            .kind = AssociationKind{.element = std::make_shared<const Schema>(std::move(*element)),
                                    .cardinality = assoc->cardinality},
            .nullable = field.nullable});
    }
    return Schema::make(std::move(fields));
}

auto parse_resource_list(std::string_view bytes) -> Result<std::vector<std::string>> {
    tinyxml2::XMLDocument doc;
    if (auto ok = parse_document(doc, bytes); !ok) {
        return std::unexpected(ok.error());
    }
    const auto* api = doc.RootElement()->FirstChildElement("api");
    if (api == nullptr) {
        return std::unexpected(schema_error("resource listing has no <api> element"));
    }
    std::vector<std::string> names;
    for (const auto* el = api->FirstChildElement(); el != nullptr; el = el->NextSiblingElement()) {
        names.emplace_back(el->Name());
    }
    return names;
}

}  // namespace wsarrow::schema
