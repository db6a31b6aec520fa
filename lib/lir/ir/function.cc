#include <lir/ir/function.hh>

namespace lir {
auto Function::type() const -> std::shared_ptr<const FunctionType> {
    std::vector<TypePtr> params;
    for (const auto& p : parameters) params.push_back(p.type);
    return FunctionType::Get(return_type, std::move(params), variadic);
}

auto Function::value() const -> ValuePtr {
    return std::make_shared<FunctionValue>(name, type(), address_space.value_or(AddressSpace{}));
}

auto Function::find_block(std::string_view block_name) const -> const BasicBlock* {
    auto it = rgs::find_if(blocks, [&](const auto& b) { return b->name() and *b->name() == block_name; });
    if (it == blocks.end()) return nullptr;
    return it->get();
}

auto Function::find_definition(std::string_view local) const -> const Operation* {
    for (const auto& b : blocks)
        for (const auto& op : b->operations())
            if (op.is_assignment() and op.identifier() == local)
                return &op;
    return nullptr;
}

auto Function::find_parameter(std::string_view local) const -> const Parameter* {
    auto it = rgs::find_if(parameters, [&](const Parameter& p) { return p.name == local; });
    if (it == parameters.end()) return nullptr;
    return &*it;
}
} // namespace lir
