/// @file src/profiles/default_tickers.cpp
/// @brief Classification data shipped with the library.

#include "pfv/profiles.hpp"

#include <array>
#include <string_view>

namespace pfv::profiles {

namespace {

using namespace std::string_view_literals;

constexpr std::array kEtfTickers = {
    // Broad index
    "SPY"sv, "QQQ"sv, "IWM"sv, "DIA"sv, "VOO"sv, "VTI"sv,
    // Sector
    "XLF"sv, "XLE"sv, "XLK"sv, "XLV"sv, "XLI"sv, "XLU"sv, "XLP"sv, "XLY"sv,
    // Leveraged / volatility
    "TQQQ"sv, "SQQQ"sv, "SPXL"sv, "SPXS"sv, "UVXY"sv, "VXX"sv,
    // Fixed income
    "TLT"sv, "HYG"sv, "LQD"sv, "AGG"sv,
    // International
    "EEM"sv, "EFA"sv, "FXI"sv, "EWZ"sv,
};

constexpr std::array kMemeTickers = {
    "GME"sv, "AMC"sv, "BB"sv, "BBBY"sv, "KOSS"sv, "EXPR"sv,
    "PLTR"sv, "RIVN"sv, "LCID"sv, "NIO"sv, "SOFI"sv, "WISH"sv,
    "CLOV"sv, "SPCE"sv, "HOOD"sv, "DKNG"sv, "RBLX"sv,
    // Crypto-adjacent
    "COIN"sv, "MSTR"sv, "RIOT"sv, "MARA"sv, "HUT"sv, "BITF"sv,
};

constexpr std::array kBlueChipTickers = {
    // Technology
    "AAPL"sv, "MSFT"sv, "GOOGL"sv, "GOOG"sv, "AMZN"sv, "META"sv, "NVDA"sv,
    "TSLA"sv, "AMD"sv, "NFLX"sv, "CRM"sv, "ORCL"sv, "ADBE"sv, "INTC"sv,
    "CSCO"sv, "QCOM"sv, "AVGO"sv, "TXN"sv,
    // Financials
    "JPM"sv, "BAC"sv, "GS"sv, "MS"sv, "V"sv, "MA"sv, "AXP"sv, "WFC"sv, "C"sv,
    // Healthcare
    "UNH"sv, "JNJ"sv, "PFE"sv, "MRK"sv, "ABBV"sv, "LLY"sv, "TMO"sv, "ABT"sv,
    // Consumer
    "WMT"sv, "COST"sv, "HD"sv, "TGT"sv, "NKE"sv, "SBUX"sv, "MCD"sv, "PG"sv,
    // Industrials
    "BA"sv, "CAT"sv, "DE"sv, "UPS"sv, "FDX"sv, "HON"sv, "GE"sv, "MMM"sv,
    // Energy
    "XOM"sv, "CVX"sv, "COP"sv, "SLB"sv, "OXY"sv,
};

}  // namespace

std::span<const std::string_view> default_etf_tickers() noexcept {
    return kEtfTickers;
}

std::span<const std::string_view> default_meme_tickers() noexcept {
    return kMemeTickers;
}

std::span<const std::string_view> default_blue_chip_tickers() noexcept {
    return kBlueChipTickers;
}

}  // namespace pfv::profiles
