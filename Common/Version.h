// WARNING: cannot be replaced by "#pragma once" because it is included from .rc file and the resource compiler does not support "#pragma once"
#ifndef __CLOUDSYNC_VERSION_H
#define __CLOUDSYNC_VERSION_H

#define VERSINFO_COPYRIGHT L"Copyright © 2025 CloudSync Authors"
#define VERSINFO_COMPANY L"CloudSync"

#define VERSINFO_DESCRIPTION L"CloudSync, Cloud Files provider library"
#define VERSINFO_COMMENT L"Safe ticket-based wrapper over the Windows Cloud Filter API."

// conversion macros num->str
#define VERSINFO_xstr(s) VERSINFO_str(s)
#define VERSINFO_str(s) L## #s

#define VERSINFO_MAJOR 1
#define VERSINFO_MINOR 2
#define VERSINFO_PATCH 0

// Increment with every build handed out, including test builds sent to a single user.
#define VERSINFO_BUILDNUMBER 14

// Reported to the shell as the sync root provider version (at most 255 characters).
#define CLOUDSYNC_VERSION_STRING VERSINFO_xstr(VERSINFO_MAJOR) L"." VERSINFO_xstr(VERSINFO_MINOR) L"." VERSINFO_xstr(VERSINFO_PATCH)

#endif // __CLOUDSYNC_VERSION_H
