#pragma once

#define FILMLIST_VERSION_MAJOR 1
#define FILMLIST_VERSION_MINOR 0
#define FILMLIST_VERSION_PATCH 0

#define FILMLIST_STRINGIFY(x) #x
#define FILMLIST_TOSTRING(x) FILMLIST_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define FILMLIST_VERSION_STRING FILMLIST_TOSTRING(FILMLIST_VERSION_MAJOR) "." FILMLIST_TOSTRING(FILMLIST_VERSION_MINOR) "." FILMLIST_TOSTRING(FILMLIST_VERSION_PATCH)
