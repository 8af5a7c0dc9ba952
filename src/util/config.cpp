#include "util/config.hpp"

#include "io/fd.hpp"
#include "util/format.hpp"

#include <cerrno>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

namespace ddi {

namespace {

using nlohmann::json;

Result GetString(const json& j, const char* key, std::string& out, bool& present) {
    present = false;
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_string())
        return Result::Fail(-1, std::string(key) + " must be a string");
    out = it->get<std::string>();
    present = true;
    return Result::Ok();
}

Result GetU64(const json& j, const char* key, std::uint64_t& out, std::uint64_t min_value) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return Result::Fail(-1, std::string(key) + " must be an integer");
    const auto v = it->get<long long>();
    if (v < 0 || static_cast<std::uint64_t>(v) < min_value)
        return Result::Fail(-1, std::string(key) + " must be >= " + std::to_string(min_value));
    out = static_cast<std::uint64_t>(v);
    return Result::Ok();
}

Result GetPositiveDouble(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_number())
        return Result::Fail(-1, std::string(key) + " must be a number");
    const double v = it->get<double>();
    if (!(v > 0))
        return Result::Fail(-1, std::string(key) + " must be > 0");
    out = v;
    return Result::Ok();
}

Result GetBool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return Result::Fail(-1, std::string(key) + " must be a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result FillFromJson(const json& j, EngineConfig& cfg) {
    if (!j.is_object())
        return Result::Fail(-1, "config root must be JSON object");

    bool present = false;
    if (auto r = GetString(j, "LogFile", cfg.log_file, present); !r.ok)
        return r;

    std::string text;
    if (auto r = GetString(j, "LogLevel", text, present); !r.ok)
        return r;
    if (present) {
        auto lvl = ParseLogLevel(text);
        if (!lvl)
            return Result::Fail(-1, "LogLevel: unknown level '" + text + "'");
        cfg.log_level = *lvl;
    }

    if (auto r = GetU64(j, "LogRetention", cfg.log_retention, 1); !r.ok)
        return r;
    if (auto r = GetU64(j, "CancelGracePeriodMs", cfg.cancel_grace_ms, 0); !r.ok)
        return r;
    if (auto r = GetU64(j, "KillWaitMs", cfg.kill_wait_ms, 0); !r.ok)
        return r;
    if (auto r = GetU64(j, "RenderIntervalMs", cfg.render_interval_ms, 10); !r.ok)
        return r;
    if (auto r = GetPositiveDouble(j, "RateWindowSeconds", cfg.rate_window_seconds); !r.ok)
        return r;
    if (auto r = GetU64(j, "RateWindowSamples", cfg.rate_window_samples, 2); !r.ok)
        return r;

    if (auto r = GetString(j, "BlockSize", text, present); !r.ok)
        return r;
    if (present) {
        auto bs = ParseBlockSize(text);
        if (!bs)
            return Result::Fail(-1, "BlockSize: invalid size '" + text + "'");
        cfg.block_size = *bs;
    }

    if (auto r = GetString(j, "DefaultView", text, present); !r.ok)
        return r;
    if (present) {
        auto mode = ParseViewMode(text);
        if (!mode)
            return Result::Fail(-1, "DefaultView: unknown view '" + text + "'");
        cfg.default_view = *mode;
    }

    if (auto r = GetU64(j, "MapRows", cfg.map_rows, 1); !r.ok)
        return r;
    if (cfg.map_rows > 16)
        return Result::Fail(-1, "MapRows must be <= 16");

    return GetBool(j, "Color", cfg.color);
}

} // namespace

Result EngineConfig::LoadFromFile(const std::string& path, EngineConfig& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid())
        return Result::FromErrno("cannot open config " + path);

    std::string text;
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Result::FromErrno("cannot read config " + path);
        }
        text.append(buf, static_cast<std::size_t>(n));
    }

    auto r = LoadFromString(text, out);
    if (!r.ok)
        return Result::Fail(r.err, path + ": " + r.msg);
    return r;
}

Result EngineConfig::LoadFromString(const std::string& json_text, EngineConfig& out) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("invalid JSON: ") + e.what());
    }

    EngineConfig tmp = out;
    auto r = FillFromJson(j, tmp);
    if (!r.ok)
        return r;
    out = std::move(tmp);
    return Result::Ok();
}

} // namespace ddi
