/**
 * @file classifier.h
 * @brief AT command type classification.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_CLASSIFIER_H_
#define NOVAAT_CLASSIFIER_H_

#include "command.h"
#include "config.h"
#include "tokenizer.h"

namespace at {

/**
 * @brief Map a type marker to a command type.
 *
 *   '=?' -> Type::test
 *   '?'  -> Type::read
 *   '='  -> Type::set
 *   none -> Type::execute
 */
Type type_of(Marker marker);

/**
 * @brief Determine the command type and check the tail agrees with it.
 *
 * Test and read commands take no parameters. Execute commands take no
 * parameters unless they are basic commands (E0), dial strings, or
 * Config::execute_parameters is set. A set command with an empty tail is
 * an error only with Config::strict_empty_set.
 *
 * @param [in] token - tokenized command.
 * @param [in] config - dialect options.
 * @param [out] type - resolved command type.
 * @return 0 on success.
 * @return -E2BIG if the type does not accept parameters.
 * @return -ENODATA if a set command is missing its parameters.
 */
int classify(const Token &token, const Config &config, Type &type);

} // namespace at

#endif // NOVAAT_CLASSIFIER_H_
