#include <kiln/config/Config.hpp>

#include <kiln/config/TomlLite.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <type_traits>

namespace kiln::config {

namespace {

constexpr std::array<std::string_view, 6> k_known_keys{
    "build.backend",
    "toolchain.family",
    "toolchain.platform",
    "make.dialect",
    "ui.color",
    "ui.progress",
};

template <typename T>
const T* find_as(const FlatMap& values, std::string_view key) {
    const auto it = values.find(std::string(key));
    return it == values.end() ? nullptr : std::get_if<T>(&it->second);
}

std::string toml_string(std::string_view s) {
    std::string out = "\"";
    for (const char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out + "\"";
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Lower-cases `value`; anything outside `allowed` becomes the first choice.
std::string pick(std::string value, std::initializer_list<std::string_view> allowed) {
    value = lower(std::move(value));
    for (const auto a : allowed) {
        if (value == a) return value;
    }
    return std::string(*allowed.begin());
}

} // namespace

bool is_known_key(std::string_view key) {
    if (key.starts_with("options.") && key.size() > 8) return true;
    return std::find(k_known_keys.begin(), k_known_keys.end(), key) != k_known_keys.end();
}

bool load(const std::filesystem::path& source_root, LoadedConfig& out, std::string& err) {
    out = LoadedConfig{};
    out.path = source_root / std::string(k_project_file);

    std::error_code ec{};
    out.present = std::filesystem::exists(out.path, ec);
    if (!toml_lite::parse_file(out.path, out.values, out.warnings, err)) return false;

    std::vector<std::string> unknown{};
    for (const auto& [k, _] : out.values) {
        if (!is_known_key(k)) unknown.push_back(k);
    }
    for (const auto& k : unknown) {
        out.warnings.push_back(out.path.string() + ": unknown key '" + k + "' ignored");
        out.values.erase(k);
    }
    return true;
}

EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    EffectiveSettings s{};
    const FlatMap& v = cfg.values;

    auto wrong_type = [&](std::string_view key, std::string_view expected) {
        if (warnings != nullptr) {
            warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected " + std::string(expected) + ")");
        }
    };
    auto get_string = [&](std::string_view key, std::string& dst) {
        if (!v.contains(std::string(key))) return;
        if (const auto* p = find_as<std::string>(v, key)) dst = *p;
        else wrong_type(key, "string");
    };
    auto get_bool = [&](std::string_view key, bool& dst) {
        if (!v.contains(std::string(key))) return;
        if (const auto* p = find_as<bool>(v, key)) dst = *p;
        else wrong_type(key, "bool");
    };

    if (v.contains("build.backend")) {
        const auto* one = find_as<std::string>(v, "build.backend");
        const auto* many = find_as<std::vector<std::string>>(v, "build.backend");
        if (one != nullptr) {
            s.build_backends = {*one};
        } else if (many != nullptr && !many->empty()) {
            s.build_backends = *many;
        } else {
            wrong_type("build.backend", "string or [string]");
        }
    }

    get_string("toolchain.family", s.toolchain_family);
    get_string("toolchain.platform", s.toolchain_platform);
    get_string("make.dialect", s.make_dialect);
    get_string("ui.color", s.ui_color);
    get_bool("ui.progress", s.ui_progress);

    s.toolchain_family = lower(std::move(s.toolchain_family));
    s.toolchain_platform = lower(std::move(s.toolchain_platform));
    s.make_dialect = pick(std::move(s.make_dialect), {"gnu", "posix"});
    s.ui_color = pick(std::move(s.ui_color), {"auto", "always", "never"});

    for (const auto& [key, val] : v) {
        if (key.starts_with("options.")) s.option_overrides[key.substr(8)] = val;
    }
    return s;
}

bool write_environment(const std::filesystem::path& build_root,
                       const RecordedEnvironment& env,
                       std::string& err) {
    FlatMap values{};
    values["kiln.version"] = env.kiln_version;
    values["configure.source_dir"] = env.source_dir;
    values["configure.build_dir"] = env.build_dir;
    values["configure.backends"] = env.backends;
    values["configure.toolchain"] = env.toolchain;
    values["configure.platform"] = env.platform;
    values["configure.make_dialect"] = env.make_dialect;
    values["configure.defines"] = env.defines;
    for (const auto& [k, val] : env.env) {
        values["env." + k] = val;
    }
    return toml_lite::write_file(build_root / std::string(k_environ_file), values, err);
}

std::optional<RecordedEnvironment> read_environment(const std::filesystem::path& build_root,
                                                    std::string& err) {
    const auto path = build_root / std::string(k_environ_file);
    std::error_code ec{};
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "no recorded environment at " + path.string() + " (run `kiln configure` first)";
        return std::nullopt;
    }

    FlatMap values{};
    std::vector<std::string> warnings{};
    if (!toml_lite::parse_file(path, values, warnings, err)) return std::nullopt;

    RecordedEnvironment out{};
    bool ok = true;
    auto get_string = [&](const std::string& key, std::string& dst) {
        if (!values.contains(key)) return;
        if (const auto* p = find_as<std::string>(values, key)) {
            dst = *p;
        } else {
            ok = false;
            err = path.string() + ": key '" + key + "' must be a string";
        }
    };
    auto get_list = [&](const std::string& key, std::vector<std::string>& dst) {
        if (!values.contains(key)) return;
        if (const auto* p = find_as<std::vector<std::string>>(values, key)) {
            dst = *p;
        } else {
            ok = false;
            err = path.string() + ": key '" + key + "' must be a string array";
        }
    };

    get_string("kiln.version", out.kiln_version);
    get_string("configure.source_dir", out.source_dir);
    get_string("configure.build_dir", out.build_dir);
    get_list("configure.backends", out.backends);
    get_string("configure.toolchain", out.toolchain);
    get_string("configure.platform", out.platform);
    get_string("configure.make_dialect", out.make_dialect);
    get_list("configure.defines", out.defines);
    for (const auto& [key, val] : values) {
        if (!key.starts_with("env.")) continue;
        if (const auto* p = std::get_if<std::string>(&val)) out.env[key.substr(4)] = *p;
    }
    if (!ok) return std::nullopt;

    if (out.source_dir.empty()) {
        err = path.string() + ": missing configure.source_dir";
        return std::nullopt;
    }
    return out;
}

std::string render_value_toml(const Value& v) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return toml_string(x);
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(x);
            } else {
                std::string out = "[";
                for (size_t i = 0; i < x.size(); ++i) {
                    if (i != 0) out += ", ";
                    if constexpr (std::is_same_v<T, std::vector<std::string>>) out += toml_string(x[i]);
                    else out += std::to_string(x[i]);
                }
                return out + "]";
            }
        },
        v);
}

// Top-level keys first, then one `[section]` per dotted prefix. FlatMap is
// ordered, so each section's keys are contiguous.
std::string render_toml(const FlatMap& values) {
    std::ostringstream oss;
    bool wrote = false;
    for (const auto& [key, val] : values) {
        if (key.find('.') != std::string::npos) continue;
        oss << key << " = " << render_value_toml(val) << "\n";
        wrote = true;
    }

    std::string section{};
    for (const auto& [key, val] : values) {
        const auto dot = key.find('.');
        if (dot == std::string::npos) continue;
        if (key.compare(0, dot, section) != 0 || section.size() != dot) {
            section = key.substr(0, dot);
            if (wrote) oss << "\n";
            oss << "[" << section << "]\n";
        }
        oss << key.substr(dot + 1) << " = " << render_value_toml(val) << "\n";
        wrote = true;
    }
    return oss.str();
}

} // namespace kiln::config
