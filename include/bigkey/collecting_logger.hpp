#ifndef BIGKEY_COLLECTING_LOGGER_HPP
#define BIGKEY_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "bigkey/util/severity.hpp"

#include "bigkey/diagnostic.hpp"
#include "bigkey/services.hpp"

namespace bigkey {

struct Collected_Diagnostic {
    Severity severity;
    std::pmr::u8string id;
    std::pmr::u8string message;

    [[nodiscard]]
    Collected_Diagnostic(const Diagnostic& d, std::pmr::memory_resource* const memory)
        : severity { d.severity }
        , id { d.id, memory }
        , message { d.message, memory }
    {
    }
};

struct Collecting_Logger final : Logger {
    std::pmr::vector<Collected_Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(
        std::pmr::memory_resource* const memory = std::pmr::get_default_resource()
    )
        : Logger { Severity::min }
        , diagnostics { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        std::pmr::memory_resource* const memory = diagnostics.get_allocator().resource();
        diagnostics.emplace_back(diagnostic, memory);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Collected_Diagnostic::id) != diagnostics.end();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id, const Severity severity) const
    {
        return std::ranges::any_of(diagnostics, [&](const Collected_Diagnostic& d) {
            return d.id == id && d.severity == severity;
        });
    }
};

} // namespace bigkey

#endif
