#pragma once

#include <string>

namespace PathResolver {

// A path is remote when it uses rsync's host:path shorthand.
bool is_remote(const std::string& path);

// $HOME, or the passwd entry of the current user when HOME is unset.
// Empty when neither is available.
std::string home_directory();

// Expand a leading "~/", drop "~/" segments embedded in an absolute path
// ("/home/u/~/data" -> "/home/u/data") and make the result absolute against
// the current working directory. Never fails; must not be given remote paths.
std::string normalize(const std::string& path);

}
