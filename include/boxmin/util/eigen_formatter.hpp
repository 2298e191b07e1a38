// Copyright (c) BoxMin contributors

#pragma once

#include <concepts>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <Eigen/Core>
#include <fmt/core.h>

template <typename EigenExprTypeT>
concept EigenTypeMatExpr = requires(const EigenExprTypeT t) {
  std::remove_cvref_t<EigenExprTypeT>::RowsAtCompileTime;
  std::remove_cvref_t<EigenExprTypeT>::ColsAtCompileTime;
  typename std::remove_cvref_t<EigenExprTypeT>::Scalar;
  { t.size() } -> std::same_as<typename Eigen::Index>;
  { t.rows() } -> std::same_as<typename Eigen::Index>;
  { t.cols() } -> std::same_as<typename Eigen::Index>;
};

enum class EigenCustomFormats {
  Default,           //
  CleanFormat,       // cf
  SingleLineFormat,  // sfl
  DebuggingFormat    // df
};

static const auto defaultFormat = Eigen::IOFormat();
static const auto cleanFormat = Eigen::IOFormat(4, 0, ", ", "\n", "[", "]");
static const auto singleLineFormat = Eigen::IOFormat(
    Eigen::StreamPrecision, Eigen::DontAlignCols, ", ", ", ", "", "", "[", "]");
static const auto debuggingFormat = Eigen::IOFormat(
    Eigen::FullPrecision, Eigen::DontAlignCols, " ", "\n", "", "", "\n", "");

/**
 * Formatter for Eigen matrices and vectors so they can be passed straight to
 * boxmin::print() and fmt::format().
 *
 * Format specs: "cf" (clean), "sfl" (single line), "df" (full precision).
 */
template <EigenTypeMatExpr MatT>
struct fmt::formatter<MatT> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    const std::string_view fmt(ctx.begin(), ctx.end() - ctx.begin());
    if (fmt.starts_with("cf")) {
      m_format = EigenCustomFormats::CleanFormat;
    }
    if (fmt.starts_with("sfl")) {
      m_format = EigenCustomFormats::SingleLineFormat;
    }
    if (fmt.starts_with("df")) {
      m_format = EigenCustomFormats::DebuggingFormat;
    }
    return ctx.begin() + fmt.find_first_of('}');
  }

  template <typename FormatContext>
  auto format(const MatT& m, FormatContext& ctx) const {
    std::ostringstream stream;
    switch (m_format) {
      case EigenCustomFormats::CleanFormat:
        stream << std::fixed << m.format(cleanFormat);
        break;
      case EigenCustomFormats::SingleLineFormat:
        stream << m.format(singleLineFormat);
        break;
      case EigenCustomFormats::DebuggingFormat:
        stream << std::fixed << m.format(debuggingFormat);
        break;
      default:
        stream << m.format(defaultFormat);
        break;
    }
    return fmt::format_to(ctx.out(), "{}", stream.str());
  }

 private:
  EigenCustomFormats m_format{EigenCustomFormats::Default};
};
