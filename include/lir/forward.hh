#ifndef LIR_FORWARD_HH
#define LIR_FORWARD_HH

#include <memory>

namespace lir {
class File;
class Context;
class Type;
class Constant;
class Value;
class Instruction;
class Terminator;
class BasicBlock;
class Function;

using TypePtr = std::shared_ptr<const Type>;
using ConstantPtr = std::shared_ptr<const Constant>;
using ValuePtr = std::shared_ptr<const Value>;
using InstructionPtr = std::shared_ptr<const Instruction>;
using TerminatorPtr = std::shared_ptr<const Terminator>;

namespace parser {
class Parser;
}
} // namespace lir

#endif // LIR_FORWARD_HH
