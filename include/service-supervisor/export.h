#ifndef SERVICE_SUPERVISOR_EXPORT_H
#define SERVICE_SUPERVISOR_EXPORT_H

#if defined(_WIN32) && !defined(SERVICE_SUPERVISOR_STATIC)
#ifdef service_supervisor_core_EXPORTS
#define SERVICE_SUPERVISOR_API __declspec(dllexport)
#else
#define SERVICE_SUPERVISOR_API __declspec(dllimport)
#endif
#else
#define SERVICE_SUPERVISOR_API
#endif

#endif // SERVICE_SUPERVISOR_EXPORT_H
