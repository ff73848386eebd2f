#pragma once

/// @brief Builds one visitor out of several lambdas for std::visit().
/// Usage:
/*
    const LambdaVisitor visitor{
      [](const TFirst &) {},
      [](const auto &) {},
    };
    std::visit(visitor, someVariant);
*/
template <typename... taLambdas>
struct LambdaVisitor : taLambdas...
{
    using taLambdas::operator()...;
};

template <typename... taLambdas>
LambdaVisitor(taLambdas...) -> LambdaVisitor<taLambdas...>;
