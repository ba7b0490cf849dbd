/**
 * =============================================================================
 * Tensor.hpp - Caller-Owned N-Dimensional Buffer with a Declared Element Type
 * =============================================================================
 *
 * The pipeline works on NCHW tensors (batch, channels, height, width).
 * A Tensor owns a zero-filled, contiguous, row-major buffer that is sized
 * once at construction and never resized afterwards.
 *
 * ELEMENT TYPE:
 * The element type is a closed tag (ElementType). Typed accessors check
 * that the requested C++ type matches the tag, so a float tensor can never
 * be silently read as double.
 *
 * ROW-MAJOR OFFSETS:
 * For shape [N, C, H, W] the flat offset of (n, c, h, w) is
 *
 *   ((n * C + c) * H + h) * W + w
 *
 * @file Tensor.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef TENSOR_HPP
#define TENSOR_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>     // std::memcpy for typed cell access
#include <initializer_list>
#include <stdexcept>   // std::invalid_argument, std::out_of_range
#include <string>
#include <utility>     // std::move
#include <vector>

/**
 * Element types a Tensor can be declared with.
 *
 * Only Float32 and Float64 can be encoded from an image; the integer types
 * exist because model inputs and outputs can carry them.
 */
enum class ElementType {
    Float32,
    Float64,
    UInt8,
    Int32,
    Int64
};

/** Human-readable name ("float32", "float64", ...). */
const char* elementTypeName(ElementType type) noexcept;

/** Size of one element in bytes. */
std::size_t elementSize(ElementType type) noexcept;

/**
 * Compile-time mapping from a C++ scalar type to its ElementType tag.
 * Only the specializations below exist; other types fail to compile.
 */
template <typename T> struct ElementTypeOf;
template <> struct ElementTypeOf<float>    { static constexpr ElementType value = ElementType::Float32; };
template <> struct ElementTypeOf<double>   { static constexpr ElementType value = ElementType::Float64; };
template <> struct ElementTypeOf<uint8_t>  { static constexpr ElementType value = ElementType::UInt8; };
template <> struct ElementTypeOf<int32_t>  { static constexpr ElementType value = ElementType::Int32; };
template <> struct ElementTypeOf<int64_t>  { static constexpr ElementType value = ElementType::Int64; };

class Tensor {
public:
    /** Rank-0 float32 tensor holding a single zero. */
    Tensor();

    /**
     * Allocate a zero-filled tensor.
     *
     * @param type  Declared element type
     * @param shape Extent of each axis, e.g. {1, 1, 64, 64}
     * @throws std::invalid_argument if any extent is negative, or if the
     *         element count or byte size would overflow size_t
     */
    Tensor(ElementType type, std::vector<int64_t> shape);

    /**
     * Build a tensor from existing values.
     *
     * @throws std::invalid_argument if values.size() != product(shape)
     */
    template <typename T>
    static Tensor fromVector(std::vector<int64_t> shape, const std::vector<T>& values) {
        Tensor t(ElementTypeOf<T>::value, std::move(shape));
        if (values.size() != t.elementCount()) {
            throw std::invalid_argument(
                "Tensor::fromVector: " + std::to_string(values.size()) +
                " values for " + std::to_string(t.elementCount()) + " elements");
        }
        if (!values.empty()) {
            std::memcpy(t.bytes_.data(), values.data(), t.bytes_.size());
        }
        return t;
    }

    ElementType elementType() const { return type_; }
    const std::vector<int64_t>& shape() const { return shape_; }
    std::size_t rank() const { return shape_.size(); }
    std::size_t elementCount() const { return elementCount_; }
    std::size_t byteSize() const { return bytes_.size(); }

    /**
     * Raw typed pointer to the contiguous storage (for handing to a runtime).
     * @throws std::invalid_argument if T does not match elementType()
     */
    template <typename T>
    T* data() {
        checkType<T>("data");
        return reinterpret_cast<T*>(bytes_.data());
    }

    template <typename T>
    const T* data() const {
        checkType<T>("data");
        return reinterpret_cast<const T*>(bytes_.data());
    }

    /**
     * Write one cell.
     *
     * @param value  Value to store
     * @param coords One coordinate per axis
     * @throws std::invalid_argument on element type mismatch
     * @throws std::out_of_range on wrong arity or out-of-bounds coordinate
     */
    template <typename T>
    void setAt(T value, const std::vector<int64_t>& coords) {
        store(value, coords.data(), coords.size(), "setAt");
    }

    /** Literal coordinates, e.g. setAt<float>(v, {0, 0, row, col}); no heap allocation. */
    template <typename T>
    void setAt(T value, std::initializer_list<int64_t> coords) {
        store(value, coords.begin(), coords.size(), "setAt");
    }

    /** Read one cell. Same checks as setAt(). */
    template <typename T>
    T at(const std::vector<int64_t>& coords) const {
        return load<T>(coords.data(), coords.size(), "at");
    }

    template <typename T>
    T at(std::initializer_list<int64_t> coords) const {
        return load<T>(coords.begin(), coords.size(), "at");
    }

    /** Copy all elements out as a vector of T. */
    template <typename T>
    std::vector<T> toVector() const {
        const T* p = data<T>();
        return std::vector<T>(p, p + elementCount_);
    }

private:
    std::size_t offsetOf(const int64_t* coords, std::size_t count) const;
    void typeMismatch(const char* where, ElementType requested) const;

    template <typename T>
    void checkType(const char* where) const {
        if (ElementTypeOf<T>::value != type_) {
            typeMismatch(where, ElementTypeOf<T>::value);
        }
    }

    template <typename T>
    void store(T value, const int64_t* coords, std::size_t count, const char* where) {
        checkType<T>(where);
        std::size_t offset = offsetOf(coords, count);
        std::memcpy(bytes_.data() + offset * sizeof(T), &value, sizeof(T));
    }

    template <typename T>
    T load(const int64_t* coords, std::size_t count, const char* where) const {
        checkType<T>(where);
        std::size_t offset = offsetOf(coords, count);
        T value;
        std::memcpy(&value, bytes_.data() + offset * sizeof(T), sizeof(T));
        return value;
    }

    ElementType type_;
    std::vector<int64_t> shape_;
    std::size_t elementCount_;
    std::vector<uint8_t> bytes_;   // allocated by operator new, aligned for double
};

#endif // TENSOR_HPP
