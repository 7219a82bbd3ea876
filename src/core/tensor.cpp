#include "tensor.hpp"

#include <cstring>
#include <new>
#include <stdexcept>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
std::vector<size_t> c_order_strides(const std::vector<size_t>& shape) {
    const int ndim = static_cast<int>(shape.size());
    std::vector<size_t> strides(ndim, 1);
    for (int i = ndim - 2; i >= 0; --i) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

// ---------------------------------------------------------------------------
// Tensor static factory
// ---------------------------------------------------------------------------
Tensor Tensor::make(std::vector<size_t> shape, DType dtype) {
    if (dtype_bytes(dtype) == 0)
        throw std::invalid_argument("Tensor::make: unknown DType");

    Tensor t;
    t.shape   = std::move(shape);
    t.strides = c_order_strides(t.shape);
    t.dtype   = dtype;

    const size_t bytes = t.nbytes();
    if (bytes == 0) {
        t.data = nullptr;
        return t;
    }

    t.data = ::operator new(bytes);
    std::memset(t.data, 0, bytes);
    return t;
}

// ---------------------------------------------------------------------------
// Destructor / move
// ---------------------------------------------------------------------------
void Tensor::free_data() {
    if (!data) return;
    ::operator delete(data);
    data = nullptr;
}

Tensor::~Tensor() {
    free_data();
}

Tensor::Tensor(Tensor&& other) noexcept
    : data(other.data)
    , shape(std::move(other.shape))
    , strides(std::move(other.strides))
    , dtype(other.dtype)
{
    other.data = nullptr;
}

Tensor& Tensor::operator=(Tensor&& other) noexcept {
    if (this == &other) return *this;
    free_data();
    data    = other.data;
    shape   = std::move(other.shape);
    strides = std::move(other.strides);
    dtype   = other.dtype;
    other.data = nullptr;
    return *this;
}

// ---------------------------------------------------------------------------
// Properties
// ---------------------------------------------------------------------------
size_t Tensor::numel() const noexcept {
    if (shape.empty()) return 0;
    size_t n = 1;
    for (size_t s : shape) n *= s;
    return n;
}

size_t Tensor::nbytes() const noexcept {
    return numel() * dtype_bytes(dtype);
}

// ---------------------------------------------------------------------------
// Element access
// ---------------------------------------------------------------------------
size_t Tensor::offset_of(std::initializer_list<size_t> idx) const {
    if (idx.size() != shape.size())
        throw std::out_of_range("Tensor::at: expected " + std::to_string(shape.size()) +
                                " indices, got " + std::to_string(idx.size()));
    size_t offset = 0;
    size_t dim    = 0;
    for (size_t i : idx) {
        if (i >= shape[dim])
            throw std::out_of_range("Tensor::at: index " + std::to_string(i) +
                                    " out of range for dim " + std::to_string(dim) +
                                    " of size " + std::to_string(shape[dim]));
        offset += i * strides[dim];
        ++dim;
    }
    return offset;
}

void Tensor::check_dtype(DType expected) const {
    if (dtype != expected)
        throw std::invalid_argument(std::string("Tensor: dtype is ") + dtype_name(dtype) +
                                    ", requested " + dtype_name(expected));
}

} // namespace wakefeed
