/**
 * @file Format.hpp
 * @brief std::format support for the vector and matrix types.
 *
 * The format spec applies to every component, so "{:.2f}" prints each
 * element with two decimals:
 *
 * @code
 * std::format("{}", Vec3{1, 2, 3});        // Vec3{1, 2, 3}
 * std::format("{:.1f}", Mat2::identity()); // Mat2{[1.0, 0.0], [0.0, 1.0]}
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_FORMAT_HPP
    #define MTR_MATH_FORMAT_HPP

    #include "Mat2.hpp"
    #include "Mat3.hpp"
    #include "Mat4.hpp"
    #include "Vec2.hpp"
    #include "Vec3.hpp"
    #include "Vec4.hpp"

    #include <format>
    #include <span>
    #include <string_view>

namespace mtr::math::detail {

/**
 * @brief Formatter base writing "Name{...}" with the float spec forwarded to
 *        every component.
 */
struct ComponentFormatter : std::formatter<core::f32> {
    template <typename FormatContext>
    auto writeComponents(std::span<const core::f32> values, FormatContext &ctx) const
    {
        auto out = ctx.out();
        for (core::usize idx = 0; idx < values.size(); ++idx)
        {
            if (idx != 0)
                out = std::format_to(out, ", ");
            ctx.advance_to(out);
            out = std::formatter<core::f32>::format(values[idx], ctx);
        }
        return out;
    }

    template <typename FormatContext>
    auto writeVector(std::string_view name, std::span<const core::f32> values,
                     FormatContext &ctx) const
    {
        ctx.advance_to(std::format_to(ctx.out(), "{}{{", name));
        ctx.advance_to(writeComponents(values, ctx));
        return std::format_to(ctx.out(), "}}");
    }

    template <typename FormatContext>
    auto writeMatrix(std::string_view name, core::u32 order,
                     std::span<const core::f32> rowMajor, FormatContext &ctx) const
    {
        ctx.advance_to(std::format_to(ctx.out(), "{}{{", name));
        for (core::u32 r = 0; r < order; ++r)
        {
            if (r != 0)
                ctx.advance_to(std::format_to(ctx.out(), ", "));
            ctx.advance_to(std::format_to(ctx.out(), "["));
            ctx.advance_to(writeComponents(rowMajor.subspan(r * order, order), ctx));
            ctx.advance_to(std::format_to(ctx.out(), "]"));
        }
        return std::format_to(ctx.out(), "}}");
    }
};

} // namespace mtr::math::detail

template <>
struct std::formatter<mtr::math::Vec2> : mtr::math::detail::ComponentFormatter {
    auto format(const mtr::math::Vec2 &v, std::format_context &ctx) const
    {
        const auto values = v.toArray();
        return writeVector("Vec2", values, ctx);
    }
};

template <>
struct std::formatter<mtr::math::Vec3> : mtr::math::detail::ComponentFormatter {
    auto format(const mtr::math::Vec3 &v, std::format_context &ctx) const
    {
        const auto values = v.toArray();
        return writeVector("Vec3", values, ctx);
    }
};

template <>
struct std::formatter<mtr::math::Vec4> : mtr::math::detail::ComponentFormatter {
    auto format(const mtr::math::Vec4 &v, std::format_context &ctx) const
    {
        const auto values = v.toArray();
        return writeVector("Vec4", values, ctx);
    }
};

template <>
struct std::formatter<mtr::math::Mat2> : mtr::math::detail::ComponentFormatter {
    auto format(const mtr::math::Mat2 &mat, std::format_context &ctx) const
    {
        const auto values = mat.toArray();
        return writeMatrix("Mat2", mtr::math::Mat2::kOrder, values, ctx);
    }
};

template <>
struct std::formatter<mtr::math::Mat3> : mtr::math::detail::ComponentFormatter {
    auto format(const mtr::math::Mat3 &mat, std::format_context &ctx) const
    {
        const auto values = mat.toArray();
        return writeMatrix("Mat3", mtr::math::Mat3::kOrder, values, ctx);
    }
};

template <>
struct std::formatter<mtr::math::Mat4> : mtr::math::detail::ComponentFormatter {
    auto format(const mtr::math::Mat4 &mat, std::format_context &ctx) const
    {
        const auto values = mat.toArray();
        return writeMatrix("Mat4", mtr::math::Mat4::kOrder, values, ctx);
    }
};

#endif // MTR_MATH_FORMAT_HPP
