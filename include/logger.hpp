#pragma once

#include "pch.hpp"

namespace hfvrp
{
    /// @brief "[a,b,c]" rendering of a node list for log messages.
    template <typename T>
    std::string format_nodes(const std::vector<T> &nodes)
    {
        std::ostringstream stream;
        stream << nodes;
        return stream.str();
    }

    /// @brief Verbosity-filtered message sink handed to the components that report progress.
    ///
    /// Level 0 is the headline output, 1 traces every search step, 2 and above trace individual
    /// candidate routes and capacity checks. A default constructed logger discards everything.
    class Logger
    {
    private:
        std::ostream *_stream;
        int _verbosity;

    public:
        explicit Logger(std::ostream *stream = nullptr, int verbosity = 0) noexcept
            : _stream(stream), _verbosity(verbosity) {}

        inline bool enabled(int level) const noexcept
        {
            return _stream != nullptr && level <= _verbosity;
        }

        inline int verbosity() const noexcept
        {
            return _verbosity;
        }

        template <typename... Args>
        void log(int level, fmt::format_string<Args...> format, Args &&...args) const
        {
            if (enabled(level))
            {
                auto indent = level > 1 ? static_cast<size_t>(2 * (level - 1)) : size_t(0);
                *_stream << std::string(indent, ' ') << fmt::format(format, std::forward<Args>(args)...) << '\n';
            }
        }
    };
}
