#pragma once

#include "../models/field.hpp"
#include "../models/type_node.hpp"

#include <string>
#include <vector>

namespace format {
/**
 * @class DeclarationViewer
 * @brief Renders decoded types as C-like declarations.
 *
 * The output is meant for documentation and debugging; it is readable C but
 * not guaranteed to compile. Rendering is deterministic.
 */
class DeclarationViewer {
public:
  /**
   * @brief Constructs a viewer.
   * @param tab The indentation unit used for struct and union members.
   */
  explicit DeclarationViewer(std::string tab = "    ");

  /**
   * @brief Renders a type.
   * @param node The type.
   * @return The declaration, multi-line for structs and unions with members.
   */
  std::string View(const models::TypeNode &node) const;

  /**
   * @brief Renders a struct or union member as a declaration line.
   * @param field The member.
   * @param fallback_name The name used when the member is unnamed.
   * @return `<type> <name>;` or `<type> <name> : <width>;`.
   */
  std::string View(const models::Field &field,
                   const std::string &fallback_name = "x") const;

  /**
   * @brief Renders a member list, one indented line per member.
   *
   * Unnamed members are called `x0`, `x1`, ... by position.
   *
   * @param fields The members.
   * @return The lines joined with newlines.
   */
  std::string ViewFields(const std::vector<models::Field> &fields) const;

  /**
   * @brief Renders a type on a single line for use in a method or property
   * declaration.
   *
   * Named structs and unions are shown by name only; `char` is shown as
   * `BOOL`.
   *
   * @param node The type.
   * @return The single-line declaration.
   */
  std::string ViewForArgument(const models::TypeNode &node) const;

  /**
   * @brief Renders a member for an Objective-C header, showing `char` and
   * `unsigned char` as `BOOL`.
   * @param field The member.
   * @param fallback_name The name used when the member is unnamed.
   * @return The declaration line.
   */
  std::string ViewForHeader(const models::Field &field,
                            const std::string &fallback_name) const;

private:
  std::string ViewAggregate(const models::TypeNode &node) const;

  std::string tab_;
};
} // namespace format
