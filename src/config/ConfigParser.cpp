#include "ConfigParser.hpp"

#include <absl/status/status.h>
#include <fmt/format.h>
#include <json/reader.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <LogCompat.hpp>

namespace imageless {

namespace {

enum class Optionality {
    OPTIONAL,
    REQUIRED,
};

absl::Status fieldError(const std::string_view path,
                        const std::string_view what) {
    return absl::InvalidArgumentError(fmt::format("{}: {}", path, what));
}

std::string join(const std::string_view path, const std::string_view name) {
    return fmt::format("{}.{}", path, name);
}

// Looks up a member. Missing optional members yield nullptr.
template <Optionality opt = Optionality::REQUIRED>
absl::StatusOr<const Json::Value*> member(const Json::Value& value,
                                          const std::string_view name,
                                          const std::string_view path) {
    if (!value.isObject()) {
        return fieldError(path, "expected an object");
    }
    const Json::Value* found =
        value.find(name.data(), name.data() + name.size());
    if (found == nullptr) {
        if constexpr (opt == Optionality::OPTIONAL) {
            return nullptr;
        } else {
            LOG(ERROR) << "Missing required field: " << join(path, name);
            return fieldError(path, fmt::format("missing field '{}'", name));
        }
    }
    DLOG(INFO) << join(path, name) << "=" << found->toStyledString();
    return found;
}

// Variants are written as an object holding exactly one key.
absl::StatusOr<std::string> variantKey(const Json::Value& value,
                                       const std::string_view path) {
    if (!value.isObject()) {
        return fieldError(path, "expected an object with a single key");
    }
    const auto names = value.getMemberNames();
    if (names.size() != 1) {
        return fieldError(path, fmt::format("expected exactly one key, got {}",
                                            names.size()));
    }
    return names.front();
}

template <typename Int>
absl::StatusOr<Int> unsignedField(const Json::Value& value,
                                  const std::string_view path,
                                  const Json::LargestUInt max =
                                      std::numeric_limits<Int>::max()) {
    if (!value.isUInt64() || value.asLargestUInt() > max) {
        return fieldError(path,
                          fmt::format("expected an integer in [0, {}]", max));
    }
    return static_cast<Int>(value.asLargestUInt());
}

absl::StatusOr<float> floatField(const Json::Value& value,
                                 const std::string_view path) {
    if (!value.isNumeric()) {
        return fieldError(path, "expected a number");
    }
    return value.asFloat();
}

absl::StatusOr<Unit> parseUnit(const Json::Value& value,
                               const std::string_view path) {
    auto key = variantKey(value, path);
    if (!key.ok()) {
        return key.status();
    }
    const Json::Value& inner = value[*key];
    const std::string innerPath = join(path, *key);
    if (*key == "pixel") {
        auto pixels = unsignedField<std::uint32_t>(inner, innerPath);
        if (!pixels.ok()) {
            return pixels.status();
        }
        return Unit(PixelUnit(*pixels));
    }
    if (*key == "percentage") {
        auto number = floatField(inner, innerPath);
        if (!number.ok()) {
            return number.status();
        }
        auto percentage = PercentageUnit::fromFloat(*number);
        if (!percentage.ok()) {
            LOG(ERROR) << innerPath << ": " << percentage.status();
            return percentage.status();
        }
        return Unit(*percentage);
    }
    return fieldError(path, fmt::format("unknown unit '{}'", *key));
}

absl::StatusOr<Coordinate> parseCoordinate(const Json::Value& value,
                                           const std::string_view path) {
    Coordinate coordinate;
    for (auto [name, unit] : {std::pair{"x", &coordinate.x},
                              std::pair{"y", &coordinate.y}}) {
        auto field = member(value, name, path);
        if (!field.ok()) {
            return field.status();
        }
        auto parsed = parseUnit(**field, join(path, name));
        if (!parsed.ok()) {
            return parsed.status();
        }
        *unit = *parsed;
    }
    return coordinate;
}

absl::StatusOr<CropOrigin> parseCropOrigin(const Json::Value& value,
                                           const std::string_view path) {
    static constexpr std::array<std::pair<std::string_view, CropOrigin::Anchor>,
                                3>
        kAnchors{{
            {"minimum", CropOrigin::Anchor::kMinimum},
            {"maximum", CropOrigin::Anchor::kMaximum},
            {"crop-start", CropOrigin::Anchor::kCropStart},
        }};

    auto key = variantKey(value, path);
    if (!key.ok()) {
        return key.status();
    }
    for (const auto& [name, anchor] : kAnchors) {
        if (*key == name) {
            auto coordinate = parseCoordinate(value[*key], join(path, name));
            if (!coordinate.ok()) {
                return coordinate.status();
            }
            return CropOrigin{anchor, *coordinate};
        }
    }
    return fieldError(path, fmt::format("unknown crop origin '{}'", *key));
}

absl::StatusOr<Operation> parseCrop(const Json::Value& value,
                                    const std::string_view path) {
    auto from = member(value, "from", path);
    if (!from.ok()) {
        return from.status();
    }
    auto to = member(value, "to", path);
    if (!to.ok()) {
        return to.status();
    }
    auto start = parseCoordinate(**from, join(path, "from"));
    if (!start.ok()) {
        return start.status();
    }
    auto origin = parseCropOrigin(**to, join(path, "to"));
    if (!origin.ok()) {
        return origin.status();
    }
    return Crop{*start, *origin};
}

absl::StatusOr<Operation> parseAdjustBrightness(const Json::Value& value,
                                                const std::string_view path) {
    auto key = variantKey(value, path);
    if (!key.ok()) {
        return key.status();
    }
    AdjustBrightness adjust;
    if (*key == "darken") {
        adjust.direction = AdjustBrightness::Direction::kDarken;
    } else if (*key == "brighten") {
        adjust.direction = AdjustBrightness::Direction::kBrighten;
    } else {
        return fieldError(path,
                          fmt::format("unknown brightness change '{}'", *key));
    }
    auto magnitude =
        unsignedField<std::uint16_t>(value[*key], join(path, *key));
    if (!magnitude.ok()) {
        return magnitude.status();
    }
    adjust.magnitude = *magnitude;
    return adjust;
}

absl::StatusOr<Operation> parseBlur(const Json::Value& value,
                                    const std::string_view path) {
    auto sigma = member(value, "sigma", path);
    if (!sigma.ok()) {
        return sigma.status();
    }
    auto parsed = floatField(**sigma, join(path, "sigma"));
    if (!parsed.ok()) {
        return parsed.status();
    }
    return Blur{*parsed};
}

absl::StatusOr<Operation> parseGrayscale(const Json::Value& value,
                                         const std::string_view path) {
    if (!value.isNull() && !value.isObject()) {
        return fieldError(path, "expected an empty object");
    }
    return Grayscale{};
}

template <typename Enum, size_t N>
absl::StatusOr<Enum> parseName(
    const Json::Value& value, const std::string_view path,
    const std::array<std::pair<std::string_view, Enum>, N>& names) {
    if (value.isString()) {
        const std::string text = value.asString();
        for (const auto& [name, result] : names) {
            if (text == name) {
                return result;
            }
        }
    }
    std::string choices;
    for (const auto& [name, result] : names) {
        choices += choices.empty() ? "" : ", ";
        choices += name;
    }
    return fieldError(path, fmt::format("expected one of {}", choices));
}

absl::StatusOr<Operation> parseResize(const Json::Value& value,
                                      const std::string_view path) {
    static constexpr std::array<std::pair<std::string_view, FilterType>, 5>
        kFilters{{
            {"nearest", FilterType::kNearest},
            {"triangle", FilterType::kTriangle},
            {"catmull-rom", FilterType::kCatmullRom},
            {"gaussian", FilterType::kGaussian},
            {"lanczos3", FilterType::kLanczos3},
        }};
    static constexpr std::array<std::pair<std::string_view, CropMode>, 3>
        kCropModes{{
            {"preserve", CropMode::kPreserve},
            {"fill", CropMode::kFill},
            {"exact", CropMode::kExact},
        }};

    Resize resize{.width = {},
                  .height = {},
                  .filter = FilterType::kNearest,
                  .cropMode = CropMode::kPreserve};

    for (auto [name, unit] : {std::pair{"width", &resize.width},
                              std::pair{"height", &resize.height}}) {
        auto field = member(value, name, path);
        if (!field.ok()) {
            return field.status();
        }
        auto parsed = parseUnit(**field, join(path, name));
        if (!parsed.ok()) {
            return parsed.status();
        }
        *unit = *parsed;
    }

    auto filter = member<Optionality::OPTIONAL>(value, "filter", path);
    if (!filter.ok()) {
        return filter.status();
    }
    if (*filter != nullptr) {
        auto parsed = parseName(**filter, join(path, "filter"), kFilters);
        if (!parsed.ok()) {
            return parsed.status();
        }
        resize.filter = *parsed;
    }

    auto cropMode = member(value, "crop_mode", path);
    if (!cropMode.ok()) {
        return cropMode.status();
    }
    auto mode = parseName(**cropMode, join(path, "crop_mode"), kCropModes);
    if (!mode.ok()) {
        return mode.status();
    }
    resize.cropMode = *mode;
    return resize;
}

using OperationParser = absl::StatusOr<Operation> (*)(const Json::Value&,
                                                      std::string_view);

constexpr std::array<std::pair<std::string_view, OperationParser>, 5>
    kOperationParsers{{
        {AdjustBrightness::kName, parseAdjustBrightness},
        {Blur::kName, parseBlur},
        {Crop::kName, parseCrop},
        {Grayscale::kName, parseGrayscale},
        {Resize::kName, parseResize},
    }};

absl::StatusOr<Operation> parseOperation(const Json::Value& value,
                                         const std::string_view path) {
    auto key = variantKey(value, path);
    if (!key.ok()) {
        return key.status();
    }
    for (const auto& [name, parser] : kOperationParsers) {
        if (*key == name) {
            return parser(value[*key], join(path, name));
        }
    }
    return fieldError(path, fmt::format("unknown operation '{}'", *key));
}

absl::StatusOr<OutputFormat> parseOutputFormat(const Json::Value& value,
                                               const std::string_view path) {
    static constexpr std::array<std::pair<std::string_view, OutputFormat::Kind>,
                                11>
        kPlainFormats{{
            {"png", OutputFormat::Kind::kPng},
            {"gif", OutputFormat::Kind::kGif},
            {"ico", OutputFormat::Kind::kIco},
            {"bmp", OutputFormat::Kind::kBmp},
            {"farbfeld", OutputFormat::Kind::kFarbfeld},
            {"tga", OutputFormat::Kind::kTga},
            {"open-exr", OutputFormat::Kind::kOpenExr},
            {"tiff", OutputFormat::Kind::kTiff},
            {"avif", OutputFormat::Kind::kAvif},
            {"qoi", OutputFormat::Kind::kQoi},
            {"web-p", OutputFormat::Kind::kWebP},
        }};

    if (value.isString()) {
        auto kind = parseName(value, path, kPlainFormats);
        if (!kind.ok()) {
            return kind.status();
        }
        return OutputFormat{.kind = *kind};
    }

    auto key = variantKey(value, path);
    if (!key.ok()) {
        return key.status();
    }
    if (*key != "jpeg") {
        return fieldError(path,
                          fmt::format("unknown output format '{}'", *key));
    }
    const std::string jpegPath = join(path, "jpeg");
    auto quality = member(value["jpeg"], "quality", jpegPath);
    if (!quality.ok()) {
        return quality.status();
    }
    auto parsed = unsignedField<int>(**quality, join(jpegPath, "quality"),
                                     OutputFormat::kMaxJpegQuality);
    if (!parsed.ok()) {
        return parsed.status();
    }
    return OutputFormat::jpeg(*parsed);
}

}  // namespace

absl::StatusOr<Config> parseConfig(const Json::Value& root) {
    constexpr std::string_view kRoot = "config";

    Config config;
    auto outFormat = member(root, "out_format", kRoot);
    if (!outFormat.ok()) {
        return outFormat.status();
    }
    auto format = parseOutputFormat(**outFormat, "out_format");
    if (!format.ok()) {
        return format.status();
    }
    config.outFormat = *format;

    auto operations = member(root, "operations", kRoot);
    if (!operations.ok()) {
        return operations.status();
    }
    if (!(*operations)->isArray()) {
        return fieldError("operations", "expected an array");
    }
    for (Json::ArrayIndex i = 0; i < (*operations)->size(); ++i) {
        auto operation = parseOperation((**operations)[i],
                                        fmt::format("operations[{}]", i));
        if (!operation.ok()) {
            return operation.status();
        }
        config.operations.emplace_back(*std::move(operation));
    }
    LOG(INFO) << "Loaded " << config.operations.size()
              << " operation(s), output format " << config.outFormat;
    return config;
}

absl::StatusOr<Config> parseConfigString(const std::string_view document) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(document.data(), document.data() + document.size(),
                       &root, &errors)) {
        LOG(ERROR) << "Failed to parse config: " << errors;
        return absl::InvalidArgumentError(
            fmt::format("Malformed configuration: {}", errors));
    }
    return parseConfig(root);
}

absl::StatusOr<Config> loadConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG(ERROR) << "Config file does not exist: " << path;
        return absl::NotFoundError(
            fmt::format("No such file: {}", path.string()));
    }
    std::ifstream file(path);
    if (!file) {
        return absl::InternalError(
            fmt::format("Failed to open {}", path.string()));
    }
    std::stringstream contents;
    contents << file.rdbuf();
    LOG(INFO) << "Loading config from " << path;
    return parseConfigString(contents.str());
}

}  // namespace imageless
