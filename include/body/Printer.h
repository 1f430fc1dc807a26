/***
 * Name: pullup::body::Printer
 * Purpose: Render method bodies as Java-like source text.
 * Inputs:
 *   - Expressions, statements or blocks
 * Outputs:
 *   - Indented text; a whitespace-normalized form for body comparison
 * Theory of Operation:
 *   A visitor over the body nodes writes into an ostringstream. Blocks are
 *   printed one statement per line at the requested indent. Casts and
 *   binary operands are parenthesized when they appear as receivers or
 *   operands so the text reads back unambiguously.
 */
#pragma once

#include <string>
#include "body/Nodes.h"

namespace pullup::body {

std::string printExpr(const Expr& e);
std::string printStmt(const Stmt& s, int indent = 0);
std::string printBlock(const Block& b, int indent = 0);

// printBlock with every whitespace run collapsed; used for duplicate detection.
std::string normalizedText(const Block& b);

} // namespace pullup::body
