#pragma once

#include <minuniq/script/registry.hh>

namespace minuniq::script {

// Drops every capability of the current process and forbids gaining new privileges (e.g. via
// setuid binaries). Throws on error.
void drop_privileges();

// Entry point of the execute mode: runs the script given as the sole argument with the suite
// detected from its extension. Returns the exit code of the whole process - the exit code of the
// script or 1 on error. Only stderr is written to, stdout belongs to the script.
int execute_mode_main(int argc, char** argv, const Registry& registry);

} // namespace minuniq::script
