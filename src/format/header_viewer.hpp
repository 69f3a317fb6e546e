#pragma once

#include "../models/method_signature.hpp"
#include "../models/property_attribute.hpp"
#include "declaration_viewer.hpp"

#include <string>
#include <vector>

namespace format {
/**
 * @class HeaderViewer
 * @brief Renders methods, properties and instance variables as Objective-C
 * header lines.
 */
class HeaderViewer {
public:
  /**
   * @brief Renders a method declaration.
   *
   * The receiver and selector arguments of the signature are not shown;
   * the remaining arguments are paired with the selector labels and named
   * `arg0`, `arg1`, ...
   *
   * @param selector The selector, e.g. "setValue:forKey:".
   * @param signature The split method type encoding.
   * @param is_class_method True for a `+` method.
   * @return The declaration, e.g. `- (void)setValue:(id)arg0 forKey:(id)arg1;`.
   */
  std::string ViewMethod(const std::string &selector,
                         const models::MethodSignature &signature,
                         bool is_class_method) const;

  /**
   * @brief Renders a property declaration.
   * @param name The property name.
   * @param attributes The parsed attribute string.
   * @param is_class_property True for a class property.
   * @return The declaration followed by `@dynamic` / `@synthesize` comments.
   */
  std::string
  ViewProperty(const std::string &name,
               const std::vector<models::PropertyAttribute> &attributes,
               bool is_class_property) const;

  /**
   * @brief Renders an instance variable declaration.
   * @param name The ivar name.
   * @param type_encoding The ivar type encoding.
   * @return The declaration, e.g. `NSString *_title;`.
   */
  std::string ViewIvar(const std::string &name,
                       const std::string &type_encoding) const;

private:
  DeclarationViewer declarations_;
};
} // namespace format
