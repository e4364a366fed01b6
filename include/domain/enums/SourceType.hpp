#pragma once

namespace inventory::domain::source_type {

// Тип документа-источника движения (открытый набор, хранится строкой)
inline constexpr const char* GOODS_RECEIPT = "GOODS_RECEIPT";
inline constexpr const char* ORDER = "ORDER";
inline constexpr const char* WASTAGE = "WASTAGE";
inline constexpr const char* WASTAGE_VOID = "WASTAGE_VOID";
inline constexpr const char* STOCK_ADJUSTMENT = "STOCK_ADJUSTMENT";
inline constexpr const char* COUNT_SESSION = "COUNT_SESSION";
inline constexpr const char* TRANSFER = "TRANSFER";
inline constexpr const char* MANUAL = "MANUAL";
inline constexpr const char* VENDOR_RETURN = "VENDOR_RETURN";
inline constexpr const char* PRODUCTION = "PRODUCTION";

} // namespace inventory::domain::source_type
