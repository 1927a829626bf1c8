/**
 * @file Math.hpp
 * @brief Umbrella header for the vector and matrix types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_MATH_HPP
    #define MTR_MATH_MATH_HPP

    #include "Vec2.hpp"
    #include "Vec3.hpp"
    #include "Vec4.hpp"
    #include "Mat2.hpp"
    #include "Mat3.hpp"
    #include "Mat4.hpp"
    #include "Format.hpp"

#endif // MTR_MATH_MATH_HPP
