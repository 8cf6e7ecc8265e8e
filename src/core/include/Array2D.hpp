#pragma once
#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace swash {

    // Dense row-major 2D array: rows run along y (index j), columns along x (index i).
    class Array2D {
    public:
        Array2D() : m_rows(0), m_cols(0) {}

        Array2D(int rows, int cols, double init_value = 0.0)
            : m_rows(rows), m_cols(cols),
              m_data(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), init_value) {}

        int rows() const { return m_rows; }
        int cols() const { return m_cols; }
        std::size_t size() const { return m_data.size(); }

        double* data() { return m_data.data(); }
        const double* data() const { return m_data.data(); }

        double& operator()(int j, int i) { return m_data[index(j, i)]; }
        const double& operator()(int j, int i) const { return m_data[index(j, i)]; }

        void fill(double value) { std::fill(m_data.begin(), m_data.end(), value); }

        bool has_shape(int rows, int cols) const { return m_rows == rows && m_cols == cols; }

        std::string shape_str() const {
            return "(" + std::to_string(m_rows) + ", " + std::to_string(m_cols) + ")";
        }

    private:
        int m_rows, m_cols;
        std::vector<double> m_data;

        inline std::size_t index(int j, int i) const {
            return static_cast<std::size_t>(j) * static_cast<std::size_t>(m_cols) + static_cast<std::size_t>(i);
        }
    };
}
