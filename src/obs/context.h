#pragma once

#include <optional>
#include <string>

namespace sectorscan::obs {

// Per-thread scan context merged into every structured log event.
struct Context {
    std::string request_id;
    std::string scan_id;
    std::string universe;
    std::optional<int> sector_id;
};

inline thread_local Context g_context{};
inline thread_local bool g_context_set = false;

inline auto GetContext() -> const Context& {
    return g_context;
}

inline auto HasContext() -> bool {
    return g_context_set;
}

inline auto SetContext(const Context& ctx) -> void {
    g_context = ctx;
    g_context_set = true;
}

inline auto ClearContext() -> void {
    g_context = Context{};
    g_context_set = false;
}

class ScopedContext {
public:
    explicit ScopedContext(const Context& ctx)
        : prev_(g_context), prev_set_(g_context_set) {
        SetContext(ctx);
    }

    ~ScopedContext() {
        if (prev_set_) {
            g_context = prev_;
            g_context_set = true;
        } else {
            ClearContext();
        }
    }

    ScopedContext(const ScopedContext&) = delete;
    auto operator=(const ScopedContext&) -> ScopedContext& = delete;

private:
    Context prev_{};
    bool prev_set_ = false;
};

// Narrows the current scan context to one sector for the enclosing scope.
class ScopedSectorContext {
public:
    explicit ScopedSectorContext(int sector_id) : scope_(WithSector(sector_id)) {}

private:
    static auto WithSector(int sector_id) -> Context {
        Context ctx = g_context;
        ctx.sector_id = sector_id;
        return ctx;
    }

    ScopedContext scope_;
};

} // namespace sectorscan::obs
