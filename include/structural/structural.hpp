#ifndef STRUCTURAL_STRUCTURAL_HPP
#define STRUCTURAL_STRUCTURAL_HPP

#include <structural/str_utils.hpp>
#include <structural/lexer.hpp>
#include <structural/declaration.hpp>
#include <structural/extract.hpp>
#include <structural/bindings.hpp>
#include <structural/canonical.hpp>
#include <structural/builder.hpp>
#include <structural/metadata.hpp>
#include <structural/fields.hpp>
#include <structural/isomorphism.hpp>
#include <structural/derive.hpp>
#include <structural/equal.hpp>
#include <structural/print.hpp>
#include <structural/edit.hpp>

#endif // STRUCTURAL_STRUCTURAL_HPP
