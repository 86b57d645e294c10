/**
 * @file errors.hpp
 * @brief crossfill の例外クラス
 */
#ifndef CROSSFILL_ERRORS_HPP
#define CROSSFILL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace crossfill {

/**
 * @brief crossfill が送出する例外の基底クラス
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief グリッド構造が不正（非矩形、スロット定義の矛盾など）
 *
 * 探索開始前のトポロジ構築時に送出される。
 */
class MalformedGridError : public Error {
public:
    explicit MalformedGridError(const std::string& what) : Error(what) {}
};

/**
 * @brief 全探索の結果、有効な割当が存在しない
 */
class UnsatisfiableError : public Error {
public:
    explicit UnsatisfiableError(const std::string& what) : Error(what) {}
};

/**
 * @brief 探索前に単語プールの不足が判明した
 *
 * あるスロット長の単語が存在しない、または同じ長さのスロット数より
 * 単語数が少ない場合。UnsatisfiableError の一種として扱う。
 */
class InsufficientPoolError : public UnsatisfiableError {
public:
    explicit InsufficientPoolError(const std::string& what) : UnsatisfiableError(what) {}
};

/**
 * @brief ステップ上限または停止要求により探索が打ち切られた
 *
 * 解なしとは区別される（結論が出ていない）。
 */
class SearchBudgetExceededError : public Error {
public:
    explicit SearchBudgetExceededError(const std::string& what) : Error(what) {}
};

} // namespace crossfill

#endif // CROSSFILL_ERRORS_HPP
