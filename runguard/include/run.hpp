#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序
 * @note 该函数必须在 main 函数最后调用，或者 fork 出一个新进程再调用本函数
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 打开输入输出文件，之后的挂载操作可能会遮住这些文件所在的目录
 * 3. 创建 cgroup，并注册 memory、pids、cpu 资源管控器，限制内存、进程数、CPU 配额
 * 4. 分离 FD、FS、IPC、NET、NS、UTS、SYSVSEM、PID 等命名空间，限制子进程树的访问权
 * 5. 构建只读的根文件系统、大小受限的 /tmp 和 box 目录
 * 6. 调用 fork 创建子进程（新 PID 命名空间的 1 号进程），并等待子进程结束
 *    1. 对于父进程（watchdog）
 *       1. 监听 SIGALRM 来进行时间限制、SIGTERM 来清除进程树
 *       2. 创建 itimer 来限制 real time，在遇到 SIGALRM 时杀死 1 号进程，整个 PID 命名空间随之销毁
 *       3. 与受控程序建立管道连接，将 stdout、stderr 分别写入文件
 *       4. 等待 1 号进程结束，并通过管道读取受控程序的退出状态
 *    2. 对于 1 号进程，挂载新的 /proc，再 fork 出受控程序并回收命名空间内的所有进程
 *    3. 对于受控程序，添加资源限制，并与父进程建立管道重定向输入输出
 *       1. 必要时清除环境变量，只保留 PATH
 *       2. 通过 rlimit 限制 CPU time
 *       3. 通过 rlimit 给予无限大的栈空间
 *       4. 将受控程序挂载到我们创建的 cgroup 上
 *       5. 设置 chroot 和工作路径
 *       6. 设置受控程序的 user 和 group 以允许文件访问权限限制
 *       7. 加载 seccomp 过滤器
 * 7. 检查受控程序是否正常退出
 *     1. 若因为信号终止，且为 SIGXCPU 则 Time Limit Exceeded，否则为 Runtime Error
 *     2. 若因为信号停止，返回 Runtime Error
 * 8. 读取 cgroup 的监测数据，得到运行时间、内存使用、是否发生 OOM
 * 9. 杀死 cgroup 内的所有进程确保选手 fork 出来的子进程都不会留驻系统
 * 10. 删除创建的 cgroup，并记录所有的信息到 meta 文件中
 */
int runit(struct runguard_options opt);
