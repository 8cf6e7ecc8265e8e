// src/core/include/types.hpp
#pragma once
#include <cmath>

namespace swash {

    // 1. The conservative point value
    struct Vector3 {
        // Anonymous union: 'data' and the struct share the same memory.
        union {
            double data[3];
            struct {
                double w;   // data[0], free-surface elevation
                double hu;  // data[1]
                double hv;  // data[2]
            };
        };

        Vector3(double d0=0, double d1=0, double d2=0)
            : w(d0), hu(d1), hv(d2) {}

        // Array Access (for loops over components)
        double& operator[](int i) { return data[i]; }
        const double& operator[](int i) const { return data[i]; }

        Vector3 operator+(const Vector3& other) const {
            return {w + other.w, hu + other.hu, hv + other.hv};
        }
        Vector3 operator-(const Vector3& other) const {
            return {w - other.w, hu - other.hu, hv - other.hv};
        }
        Vector3 operator*(double scalar) const {
            return {w * scalar, hu * scalar, hv * scalar};
        }
    };

    using Conserved = Vector3;

    // 2. The non-conservative state (depth and velocities)
    struct Primitive {
        double h, u, v;

        Primitive() : h(0), u(0), v(0) {}
        Primitive(double _h, double _u, double _v) : h(_h), u(_u), v(_v) {}

        // Velocity from momentum, forced to zero on (nearly) dry points
        static double velocity(double h, double momentum, double drytol) {
            return (h < drytol) ? 0.0 : momentum / h;
        }

        // Conserved -> Primitive, given the bed elevation at the same point
        static Primitive from_conserved(const Conserved& q, double b, double drytol) {
            double h = q.w - b;
            return {h, velocity(h, q.hu, drytol), velocity(h, q.hv, drytol)};
        }

        // Primitive -> Conserved
        Conserved to_conserved(double b) const {
            return {h + b, h * u, h * v};
        }
    };
}
