#pragma once

#include "common/cancellation.hpp"
#include "runguard_options.hpp"

namespace kata {

/**
 * @brief 根据传入的设置运行指定的程序，阻塞直到程序结束或者被杀死
 * 与独立的 runguard 程序不同，这个函数在引擎的 worker 线程中调用，
 * 因此不安装任何信号处理函数，也不修改进程级别的状态。
 * 1. 创建管道连接子进程的 stdout/stderr，以及一个 close-on-exec 的状态管道，
 *    用于在 exec 失败时将 errno 传回父进程
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程
 *       1. 将子进程分离到一个独立的进程组，以便通过 kill(-pgid) 杀死整个进程树
 *       2. 重定向标准输入输出，切换工作路径
 *       3. 通过 rlimit 限制 CPU time、输出文件大小、进程数，禁止 core dump
 *       4. 调用 execvpe 执行命令
 *    2. 对于父进程，轮询管道读取输出，并检查截止时间和取消信号
 *       1. 输出超过 stream_size 时继续读取并丢弃，只统计字节数，并标记截断
 *       2. 超时或取消时，对进程组发送 SIGTERM，等待 kill_delay 后发送 SIGKILL
 * 3. 子进程退出后，杀死进程组内残留的子孙进程，回收子进程
 * 4. 检查子进程是否正常退出，记录退出码或者导致退出的信号
 * @param opt 运行设置
 * @param cancel 调用方的取消信号，可以为空
 * @return 运行结果
 * @throw std::system_error 无法创建管道或者 fork 失败
 */
runguard_result runit(const runguard_options &opt, const cancellation_token *cancel = nullptr);

}  // namespace kata
