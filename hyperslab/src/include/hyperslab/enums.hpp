#pragma once

#include <cstddef>
#include <cstdint>

namespace hyperslab {

// Element types a HyperRectangleReader can decode.
enum class DataType : uint8_t {
    UINT8 = 1,
    INT8 = 2,
    UINT16 = 3,
    INT16 = 4,
    UINT32 = 5,
    INT32 = 6,
    UINT64 = 7,
    INT64 = 8,
    FLOAT32 = 9,
    FLOAT64 = 10
};

// Size in bytes of one element
inline size_t datatype_size(DataType dt) {
    switch (dt) {
        case DataType::UINT8:
        case DataType::INT8:
            return 1;
        case DataType::UINT16:
        case DataType::INT16:
            return 2;
        case DataType::UINT32:
        case DataType::INT32:
        case DataType::FLOAT32:
            return 4;
        case DataType::UINT64:
        case DataType::INT64:
        case DataType::FLOAT64:
            return 8;
        default:
            return 0;
    }
}

template <typename T> struct datatype_of;
template <> struct datatype_of<uint8_t>  { static constexpr DataType value = DataType::UINT8; };
template <> struct datatype_of<int8_t>   { static constexpr DataType value = DataType::INT8; };
template <> struct datatype_of<uint16_t> { static constexpr DataType value = DataType::UINT16; };
template <> struct datatype_of<int16_t>  { static constexpr DataType value = DataType::INT16; };
template <> struct datatype_of<uint32_t> { static constexpr DataType value = DataType::UINT32; };
template <> struct datatype_of<int32_t>  { static constexpr DataType value = DataType::INT32; };
template <> struct datatype_of<uint64_t> { static constexpr DataType value = DataType::UINT64; };
template <> struct datatype_of<int64_t>  { static constexpr DataType value = DataType::INT64; };
template <> struct datatype_of<float>    { static constexpr DataType value = DataType::FLOAT32; };
template <> struct datatype_of<double>   { static constexpr DataType value = DataType::FLOAT64; };

inline const char* datatype_name(DataType dt) {
    switch (dt) {
        case DataType::UINT8: return "uint8";
        case DataType::INT8: return "int8";
        case DataType::UINT16: return "uint16";
        case DataType::INT16: return "int16";
        case DataType::UINT32: return "uint32";
        case DataType::INT32: return "int32";
        case DataType::UINT64: return "uint64";
        case DataType::INT64: return "int64";
        case DataType::FLOAT32: return "float32";
        case DataType::FLOAT64: return "float64";
        default: return "unknown";
    }
}

}  // namespace hyperslab
