#pragma once

#include "../models/line.hpp"
#include <cstddef>

namespace lexer {
/**
 * @class NestingTracker
 * @brief Keeps the chain of open blocks of one parse.
 *
 * The current parent is the innermost open block opening; its own parent
 * links make up the rest of the chain. A block closed by a property lacking
 * its ';' is popped one call later, when the synthetic closure is emitted.
 */
class NestingTracker {
public:
  NestingTracker();

  /**
   * @brief Gets the innermost open block.
   * @return The block opening line, null at top level.
   */
  const models::LinePtr &GetCurrParent() const { return curr_parent_; }

  /**
   * @brief Gets the number of open blocks.
   */
  std::size_t GetLevel() const;

  /**
   * @brief Checks if a synthetic closure must be emitted before reading on.
   */
  bool HasPendingClosure() const { return pending_closure_; }

  /**
   * @brief Updates the chain after a line was classified.
   * @param line The produced line.
   * @param terminator The delimiter that ended its statement.
   */
  void Track(const models::LinePtr &line, char32_t terminator);

  /**
   * @brief Emits the deferred closure and pops its block.
   * @return The closure line, parented to the popped block.
   */
  models::LinePtr EmitPendingClosure();

private:
  /**
   * @brief Closes the current block, a no-op at top level.
   */
  void Pop();

  models::LinePtr curr_parent_;
  bool pending_closure_;
  int pending_line_number_;
};
} // namespace lexer
