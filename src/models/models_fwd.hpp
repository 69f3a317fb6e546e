#pragma once

namespace models {

enum class Modifier : char;

class TypeNode;
struct Field;
struct MethodValue;
struct MethodSignature;

} // namespace models
