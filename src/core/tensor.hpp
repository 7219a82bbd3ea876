#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Data types
// ---------------------------------------------------------------------------
enum class DType : uint8_t {
    Float32 = 0,
    UInt8   = 1,
};

// No throw: returns 0 for unknown types.
inline size_t dtype_bytes(DType dt) noexcept {
    switch (dt) {
        case DType::Float32: return 4;
        case DType::UInt8:   return 1;
        default:             return 0;
    }
}

inline const char* dtype_name(DType dt) {
    switch (dt) {
        case DType::Float32: return "float32";
        case DType::UInt8:   return "uint8";
    }
    throw std::invalid_argument("Unknown DType");
}

// Compile-time mapping from element type to DType, used by Tensor::at<T>().
template<typename T> struct dtype_of;
template<> struct dtype_of<float>   { static constexpr DType value = DType::Float32; };
template<> struct dtype_of<uint8_t> { static constexpr DType value = DType::UInt8;   };

// ---------------------------------------------------------------------------
// Tensor: owning, RAII, host buffer in C-order (row-major).
// Non-copyable, movable.
// ---------------------------------------------------------------------------
struct Tensor {
    void*               data    = nullptr;
    std::vector<size_t> shape;
    std::vector<size_t> strides;   // in elements
    DType               dtype   = DType::Float32;

    Tensor() = default;
    ~Tensor();

    Tensor(const Tensor&) = delete;
    Tensor& operator=(const Tensor&) = delete;
    Tensor(Tensor&&) noexcept;
    Tensor& operator=(Tensor&&) noexcept;

    // Allocate a zero-filled contiguous tensor.
    static Tensor make(std::vector<size_t> shape, DType dtype);

    // Total number of elements.
    size_t numel() const noexcept;

    // Size in bytes.
    size_t nbytes() const noexcept;

    size_t ndim() const noexcept { return shape.size(); }

    // Typed element access with rank, bounds and dtype checks.
    //   t.at<float>({b, step, feature})
    template<typename T>
    T& at(std::initializer_list<size_t> idx);
    template<typename T>
    const T& at(std::initializer_list<size_t> idx) const;

    // Raw typed pointer to the first element (dtype checked).
    template<typename T>
    T* data_as();
    template<typename T>
    const T* data_as() const;

private:
    size_t offset_of(std::initializer_list<size_t> idx) const;
    void   check_dtype(DType expected) const;
    void   free_data();
};

// Compute C-order strides for a given shape.
std::vector<size_t> c_order_strides(const std::vector<size_t>& shape);

// ---------------------------------------------------------------------------
// Template implementations
// ---------------------------------------------------------------------------
template<typename T>
T& Tensor::at(std::initializer_list<size_t> idx) {
    check_dtype(dtype_of<T>::value);
    return static_cast<T*>(data)[offset_of(idx)];
}

template<typename T>
const T& Tensor::at(std::initializer_list<size_t> idx) const {
    check_dtype(dtype_of<T>::value);
    return static_cast<const T*>(data)[offset_of(idx)];
}

template<typename T>
T* Tensor::data_as() {
    check_dtype(dtype_of<T>::value);
    return static_cast<T*>(data);
}

template<typename T>
const T* Tensor::data_as() const {
    check_dtype(dtype_of<T>::value);
    return static_cast<const T*>(data);
}

} // namespace wakefeed
