#include "callscope/types.hpp"
#include <type_traits>

namespace callscope {

std::string make_identity(const std::string &package, const std::string &receiver,
                          const std::string &name) {
    if (receiver.empty()) {
        return package + "." + name;
    }
    return package + "/" + receiver + "." + name;
}

const char *call_kind_to_string(const CallTarget &target) {
    return std::visit(
        [](const auto &t) -> const char * {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, LocalCall>)
                return "local";
            else if constexpr (std::is_same_v<T, CrossModuleCall>)
                return "cross-module";
            else if constexpr (std::is_same_v<T, MethodCall>)
                return "method";
            else if constexpr (std::is_same_v<T, ExternalCall>)
                return "external";
            else
                return "literal";
        },
        target);
}

const char *external_origin_to_string(ExternalOrigin origin) {
    switch (origin) {
    case ExternalOrigin::Import:
        return "import";
    case ExternalOrigin::Missing:
        return "missing";
    default:
        return "unknown";
    }
}

const char *invocation_mode_to_string(InvocationMode mode) {
    switch (mode) {
    case InvocationMode::Deferred:
        return "defer";
    case InvocationMode::Goroutine:
        return "go";
    default:
        return "direct";
    }
}

std::string call_target_name(const CallTarget &target) {
    return std::visit(
        [](const auto &t) -> std::string {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, LocalCall> || std::is_same_v<T, CrossModuleCall>) {
                return t.function ? t.function->identity() : std::string();
            } else if constexpr (std::is_same_v<T, MethodCall>) {
                return t.receiver + "." + t.method;
            } else if constexpr (std::is_same_v<T, ExternalCall>) {
                if (!t.import_path.empty())
                    return t.import_path + "." + t.name;
                return t.name;
            } else {
                return "func";
            }
        },
        target);
}

} // namespace callscope
