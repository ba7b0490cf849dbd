/**
 * =============================================================================
 * Tensor.cpp - Tensor Allocation and Bounds-Checked Addressing
 * =============================================================================
 *
 * @file Tensor.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "Tensor.hpp"

#include <limits>
#include <sstream>

const char* elementTypeName(ElementType type) noexcept {
    switch (type) {
        case ElementType::Float32: return "float32";
        case ElementType::Float64: return "float64";
        case ElementType::UInt8:   return "uint8";
        case ElementType::Int32:   return "int32";
        case ElementType::Int64:   return "int64";
    }
    return "unknown";
}

std::size_t elementSize(ElementType type) noexcept {
    switch (type) {
        case ElementType::Float32: return sizeof(float);
        case ElementType::Float64: return sizeof(double);
        case ElementType::UInt8:   return sizeof(uint8_t);
        case ElementType::Int32:   return sizeof(int32_t);
        case ElementType::Int64:   return sizeof(int64_t);
    }
    return 0;
}

Tensor::Tensor()
    : type_(ElementType::Float32)
    , elementCount_(1)
    , bytes_(sizeof(float), 0)
{
}

namespace {

// a * b, refusing to wrap past size_t
std::size_t checkedMul(std::size_t a, std::size_t b, const char* what) {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) {
        throw std::invalid_argument(std::string("Tensor: ") + what + " overflows size_t");
    }
    return a * b;
}

} // namespace

Tensor::Tensor(ElementType type, std::vector<int64_t> shape)
    : type_(type)
    , shape_(std::move(shape))
    , elementCount_(1)
{
    // Product of all extents; a rank-0 tensor holds one scalar
    for (int64_t dim : shape_) {
        if (dim < 0) {
            throw std::invalid_argument("Tensor: negative dimension " + std::to_string(dim));
        }
        elementCount_ = checkedMul(elementCount_, static_cast<std::size_t>(dim), "element count");
    }
    bytes_.assign(checkedMul(elementCount_, elementSize(type_), "byte size"), 0);
}

std::size_t Tensor::offsetOf(const int64_t* coords, std::size_t count) const {
    if (count != shape_.size()) {
        std::ostringstream msg;
        msg << "Tensor: " << count << " coordinates given for a rank-"
            << shape_.size() << " tensor";
        throw std::out_of_range(msg.str());
    }

    std::size_t offset = 0;
    for (std::size_t axis = 0; axis < shape_.size(); ++axis) {
        if (coords[axis] < 0 || coords[axis] >= shape_[axis]) {
            std::ostringstream msg;
            msg << "Tensor: index " << coords[axis] << " out of range for axis "
                << axis << " with extent " << shape_[axis];
            throw std::out_of_range(msg.str());
        }
        offset = offset * static_cast<std::size_t>(shape_[axis]) +
                 static_cast<std::size_t>(coords[axis]);
    }
    return offset;
}

void Tensor::typeMismatch(const char* where, ElementType requested) const {
    throw std::invalid_argument(std::string("Tensor::") + where + ": requested " +
                                elementTypeName(requested) + " but tensor holds " +
                                elementTypeName(type_));
}
