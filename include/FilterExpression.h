#pragma once

#include "DataFrame.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Parsed row predicate of a filter action.
 * @details Grammar:
 *   expr       := and_expr ("or" and_expr)*
 *   and_expr   := primary ("and" primary)*
 *   primary    := "(" expr ")" | column op literal
 *   column     := identifier | `back quoted`
 *   op         := == | != | < | <= | > | >=
 *   literal    := number | 'string' | "string" | null
 * A missing cell satisfies only "== null" and "!= null" never holds for it.
 */
class FilterExpression {
public:
    /**
     * @throws Sieve::ResolutionException (action type "filter") on a syntax error.
     */
    static FilterExpression parse(const std::string& code);

    /**
     * @brief Identifier usable in an expression for `column`, back-quoted when needed.
     */
    static std::string quoteColumn(const std::string& column);

    /**
     * @brief Keep-mask over the rows of `data`.
     * @throws Sieve::ResolutionException naming the column when it is absent.
     */
    MissingMask evaluate(const DataFrame& data) const;

    std::vector<std::string> referencedColumns() const;

    struct Node;

private:
    explicit FilterExpression(std::shared_ptr<const Node> root) : root_(std::move(root)) {}

    std::shared_ptr<const Node> root_;
};
