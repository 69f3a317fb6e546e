#pragma once

#include "models_fwd.hpp"
#include "modifier.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace models {

/**
 * @class TypeNode
 * @brief Structured description of one Objective-C type encoding.
 *
 * A TypeNode is a tagged recursive value: pointers, arrays, modifiers and
 * blocks own their child nodes, structs and unions own their fields.
 * Nodes are built once through the static factories and never mutated.
 * Copying a node copies the whole tree.
 */
class TypeNode {
public:
  /**
   * @enum Kind
   * @brief The variant held by a TypeNode.
   */
  enum class Kind {
    kClass,
    kSelector,
    kChar,
    kUChar,
    kShort,
    kUShort,
    kInt,
    kUInt,
    kLong,
    kULong,
    kLongLong,
    kULongLong,
    kInt128,
    kUInt128,
    kFloat,
    kDouble,
    kLongDouble,
    kBool,
    kVoid,
    kVoidConst, /**< Void marked const, method arguments only. */
    kVoidIn,    /**< Void marked in, method arguments only. */
    kUnknown,   /**< The `?` encoding. */
    kCharPtr,   /**< `char *`, distinct from a pointer to char. */
    kAtom,
    kObject,
    kBlock,
    kFunctionPointer,
    kArray,
    kPointer,
    kBitField,
    kUnion,
    kStruct,
    kModified,
    kOther,
  };

  TypeNode(const TypeNode &other);
  TypeNode(TypeNode &&other) noexcept;
  TypeNode &operator=(const TypeNode &other);
  TypeNode &operator=(TypeNode &&other) noexcept;
  ~TypeNode();

  /**
   * @brief Creates a primitive node.
   * @param kind A primitive kind (kClass through kAtom).
   * @return The node.
   * @throws std::invalid_argument if kind is not a primitive kind. This is
   * a programming error; decoding never passes such a kind.
   */
  static TypeNode Primitive(Kind kind);

  /**
   * @brief Creates an object node.
   * @param class_name The class or `<Protocol>` name, none for plain `id`.
   * @return The node.
   */
  static TypeNode Object(std::optional<std::string> class_name = std::nullopt);

  /**
   * @brief Creates an opaque block node without a signature.
   * @return The node.
   */
  static TypeNode Block();

  /**
   * @brief Creates a block node with an embedded signature.
   * @param return_type The block return type.
   * @param param_types The block parameter types.
   * @return The node.
   */
  static TypeNode Block(TypeNode return_type,
                        std::vector<TypeNode> param_types);

  /**
   * @brief Creates an opaque function pointer node.
   * @return The node.
   */
  static TypeNode FunctionPointer();

  /**
   * @brief Creates a fixed or unsized array node.
   * @param element_type The element type.
   * @param count The element count, none when absent from the encoding.
   * @return The node.
   */
  static TypeNode Array(TypeNode element_type,
                        std::optional<int> count = std::nullopt);

  /**
   * @brief Creates a pointer node.
   * @param pointee The pointed-to type.
   * @return The node.
   */
  static TypeNode Pointer(TypeNode pointee);

  /**
   * @brief Creates a bit-field node.
   * @param width The width in bits.
   * @return The node.
   */
  static TypeNode BitField(int width);

  /**
   * @brief Creates a struct node.
   * @param name The struct name; empty and "?" are stored as none.
   * @param fields The members, none for an opaque struct.
   * @return The node.
   */
  static TypeNode Struct(std::optional<std::string> name,
                         std::optional<std::vector<Field>> fields);

  /**
   * @brief Creates a union node.
   * @param name The union name; empty and "?" are stored as none.
   * @param fields The members, none for an opaque union.
   * @return The node.
   */
  static TypeNode Union(std::optional<std::string> name,
                        std::optional<std::vector<Field>> fields);

  /**
   * @brief Wraps a node with a qualifier.
   * @param modifier The qualifier.
   * @param inner The qualified type.
   * @return The node.
   */
  static TypeNode Modified(Modifier modifier, TypeNode inner);

  /**
   * @brief Creates a node for an encoding kept as raw text.
   * @param raw The encoding text.
   * @return The node.
   */
  static TypeNode Other(std::string raw);

  /**
   * @brief Looks up the one-character encodings of the primitive table.
   * @param value The encoding character.
   * @return The primitive node (plain `id` for '@'), or std::nullopt.
   */
  static std::optional<TypeNode> FromPrimitiveEncoding(char value);

  /**
   * @brief Checks whether a kind is a primitive kind.
   * @param kind The kind.
   * @return True for kClass through kAtom.
   */
  static bool IsPrimitiveKind(Kind kind);

  Kind GetKind() const { return kind_; }

  /**
   * @brief Checks whether the node is a struct or a union.
   * @return True for kStruct and kUnion.
   */
  bool IsAggregate() const {
    return kind_ == Kind::kStruct || kind_ == Kind::kUnion;
  }

  /**
   * @brief Gets the object class name or the struct/union name.
   * @return The name, none when anonymous or plain `id`.
   */
  const std::optional<std::string> &GetName() const { return name_; }

  /**
   * @brief Gets the raw text of a kOther node.
   * @return The raw text, empty for other kinds.
   */
  std::string GetRaw() const;

  /**
   * @brief Gets the child node.
   *
   * The pointee of a pointer, the element of an array, the qualified type of
   * a modified node and the return type of a block with a signature.
   *
   * @return The child, or nullptr when the node has none.
   */
  const TypeNode *GetInner() const { return inner_.get(); }

  /**
   * @brief Gets the parameter types of a block.
   * @return The parameters, or nullptr for an opaque block or other kinds.
   */
  const std::vector<TypeNode> *GetParamTypes() const;

  /**
   * @brief Gets the members of a struct or union.
   * @return The members, or nullptr when the aggregate is opaque.
   */
  const std::vector<Field> *GetFields() const;

  /**
   * @brief Gets the array element count.
   * @return The count, none for an unsized array or other kinds.
   */
  std::optional<int> GetCount() const { return count_; }

  /**
   * @brief Gets the bit-field width.
   * @return The width, zero for other kinds.
   */
  int GetWidth() const {
    return kind_ == Kind::kBitField ? count_.value_or(0) : 0;
  }

  Modifier GetModifier() const { return modifier_; }

  /**
   * @brief Serializes the node back to its type encoding.
   * @return The encoding text.
   */
  std::string Encode() const;

  bool operator==(const TypeNode &other) const;
  bool operator!=(const TypeNode &other) const { return !(*this == other); }

private:
  explicit TypeNode(Kind kind);

  Kind kind_;
  std::optional<std::string> name_;
  std::unique_ptr<TypeNode> inner_;
  std::vector<TypeNode> params_;
  bool has_params_ = false;
  std::vector<Field> fields_;
  bool has_fields_ = false;
  std::optional<int> count_;
  Modifier modifier_ = Modifier::kConst;
};

} // namespace models
