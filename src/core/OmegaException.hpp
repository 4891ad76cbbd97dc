//
// OmegaException.hpp
//

#ifndef CAROQUEST_OMEGAEXCEPTION_HPP
#define CAROQUEST_OMEGAEXCEPTION_HPP
#include <algorithm>
#include <concepts>
#include <format>
#include <optional>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>

namespace caroquest::core
{
    // A code type that names itself through an ADL-visible to_string.
    template <typename T>
    concept NamedCode = requires(T c)
    {
        { to_string(c) } -> std::convertible_to<std::string_view>;
    };

    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    // Carries the failure code, where it was raised and, once a caller knows it, the game it happened in.
    template <typename T>
    class OmegaException
    {
    public:
        static constexpr std::size_t MaxFrames = 16;

        OmegaException(std::string err_str,
                       T code,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            code_{std::move(code)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        [[nodiscard]]
        auto data() const noexcept -> T const& { return code_; }

        [[nodiscard]]
        auto game() const noexcept -> std::optional<std::string> const& { return game_id_; }

        // First caller that knows the session tags it; later tags do not overwrite.
        auto with_game(std::string_view game_id) -> OmegaException&
        {
            if (!game_id_) game_id_ = std::string{game_id};
            return *this;
        }

        [[nodiscard]]
        auto code_name() const -> std::string
        {
            if constexpr (NamedCode<T>)
            {
                return std::string{to_string(code_)};
            }
            else
            {
                return std::format("{}", static_cast<long long>(code_));
            }
        }

        // One-line summary: code, game, message.
        [[nodiscard]]
        auto summary() const -> std::string
        {
            return std::format("[{}]{} {}", code_name(),
                               game_id_ ? std::format(" game {}:", *game_id_) : std::string{":"}, err_str_);
        }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}\n  at {}({}:{}) in `{}`\n", summary(), src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            std::size_t const frames = std::min(backtrace_.size(), MaxFrames);
            for (std::size_t i = 0; i < frames; ++i)
            {
                auto const& f = backtrace_[i];
                s += std::format("  #{} {}({}): {}\n", i, f.source_file(), f.source_line(), f.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T code_;
        std::source_location const src_loc_;
        std::stacktrace backtrace_;
        std::optional<std::string> game_id_{};
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<caroquest::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(caroquest::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        return std::formatter<std::string_view>::format(p.to_str(), ctx);
    }
};
#endif //CAROQUEST_OMEGAEXCEPTION_HPP
