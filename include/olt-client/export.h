#ifndef OLT_CLIENT_EXPORT_H
#define OLT_CLIENT_EXPORT_H

#ifdef _WIN32
#ifdef olt_client_core_EXPORTS
#define OLT_CLIENT_API __declspec(dllexport)
#else
#define OLT_CLIENT_API __declspec(dllimport)
#endif
#else
#define OLT_CLIENT_API
#endif

#endif // OLT_CLIENT_EXPORT_H
