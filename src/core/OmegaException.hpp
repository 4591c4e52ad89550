#ifndef KLONDIKE_OMEGAEXCEPTION_HPP
#define KLONDIKE_OMEGAEXCEPTION_HPP
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <fmt/format.h>

namespace klondike::core
{
    // Engine exception: a message, a code of type T and the throw site.
    // No std::stacktrace is captured; on GCC 12 it needs -lstdc++_libbacktrace,
    // so the source_location of the throw is the only position carried.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string message, T code,
                       std::source_location const& site = std::source_location::current()) :
            message_{std::move(message)},
            code_{std::move(code)},
            site_{site}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto data() const noexcept -> T const& { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return site_; }

        // "Game.cpp:56 in `auto klondike::core::GameImpl::SlotAt(...)`", path stripped to the file name.
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string_view file{site_.file_name()};
            if (auto const cut = file.find_last_of("/\\"); cut != std::string_view::npos)
            {
                file.remove_prefix(cut + 1);
            }
            return fmt::format("{}:{} in `{}`", file, site_.line(), site_.function_name());
        }

    private:
        std::string message_;
        T code_;
        std::source_location site_;
    };
}

template <class E>
struct fmt::formatter<E, char, std::enable_if_t<std::is_base_of_v<
    klondike::core::OmegaException<std::remove_cvref_t<decltype(std::declval<E const&>().data())>>, E>>>
    : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(E const& e, FormatContext& ctx) const
    {
        std::string const s = fmt::format("[code {}] {} at {}\n", static_cast<unsigned>(e.data()), e.what(),
                                          e.to_str());
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //KLONDIKE_OMEGAEXCEPTION_HPP
