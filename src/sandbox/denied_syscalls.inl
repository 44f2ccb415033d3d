// Denied system calls, grouped by category.
// Include after defining SANDTEST_DENY(category, name); entries for syscalls the target
// architecture does not have are skipped.

// NOLINTBEGIN(bugprone-macro-parentheses)

// Termination
#ifdef SYS_exit
SANDTEST_DENY(Termination, exit)
#endif
#ifdef SYS_exit_group
SANDTEST_DENY(Termination, exit_group)
#endif
#ifdef SYS_kill
SANDTEST_DENY(Termination, kill)
#endif
#ifdef SYS_tkill
SANDTEST_DENY(Termination, tkill)
#endif
#ifdef SYS_tgkill
SANDTEST_DENY(Termination, tgkill) // Permitted when a worker signals itself, see CapabilityPolicy::permits_call
#endif
#ifdef SYS_rt_sigqueueinfo
SANDTEST_DENY(Termination, rt_sigqueueinfo)
#endif
#ifdef SYS_rt_tgsigqueueinfo
SANDTEST_DENY(Termination, rt_tgsigqueueinfo)
#endif
#ifdef SYS_pidfd_open
SANDTEST_DENY(Termination, pidfd_open)
#endif
#ifdef SYS_pidfd_send_signal
SANDTEST_DENY(Termination, pidfd_send_signal)
#endif
#ifdef SYS_reboot
SANDTEST_DENY(Termination, reboot)
#endif

// Creation
#ifdef SYS_clone
SANDTEST_DENY(Creation, clone)
#endif
#ifdef SYS_clone3
SANDTEST_DENY(Creation, clone3)
#endif
#ifdef SYS_fork
SANDTEST_DENY(Creation, fork)
#endif
#ifdef SYS_vfork
SANDTEST_DENY(Creation, vfork)
#endif
#ifdef SYS_execve
SANDTEST_DENY(Creation, execve)
#endif
#ifdef SYS_execveat
SANDTEST_DENY(Creation, execveat)
#endif
#ifdef SYS_unshare
SANDTEST_DENY(Creation, unshare)
#endif
#ifdef SYS_setns
SANDTEST_DENY(Creation, setns)
#endif

// Filesystem
#ifdef SYS_open
SANDTEST_DENY(Filesystem, open)
#endif
#ifdef SYS_openat
SANDTEST_DENY(Filesystem, openat)
#endif
#ifdef SYS_openat2
SANDTEST_DENY(Filesystem, openat2)
#endif
#ifdef SYS_creat
SANDTEST_DENY(Filesystem, creat)
#endif
#ifdef SYS_unlink
SANDTEST_DENY(Filesystem, unlink)
#endif
#ifdef SYS_unlinkat
SANDTEST_DENY(Filesystem, unlinkat)
#endif
#ifdef SYS_rename
SANDTEST_DENY(Filesystem, rename)
#endif
#ifdef SYS_renameat
SANDTEST_DENY(Filesystem, renameat)
#endif
#ifdef SYS_renameat2
SANDTEST_DENY(Filesystem, renameat2)
#endif
#ifdef SYS_mkdir
SANDTEST_DENY(Filesystem, mkdir)
#endif
#ifdef SYS_mkdirat
SANDTEST_DENY(Filesystem, mkdirat)
#endif
#ifdef SYS_rmdir
SANDTEST_DENY(Filesystem, rmdir)
#endif
#ifdef SYS_link
SANDTEST_DENY(Filesystem, link)
#endif
#ifdef SYS_linkat
SANDTEST_DENY(Filesystem, linkat)
#endif
#ifdef SYS_symlink
SANDTEST_DENY(Filesystem, symlink)
#endif
#ifdef SYS_symlinkat
SANDTEST_DENY(Filesystem, symlinkat)
#endif
#ifdef SYS_chmod
SANDTEST_DENY(Filesystem, chmod)
#endif
#ifdef SYS_fchmod
SANDTEST_DENY(Filesystem, fchmod)
#endif
#ifdef SYS_fchmodat
SANDTEST_DENY(Filesystem, fchmodat)
#endif
#ifdef SYS_chown
SANDTEST_DENY(Filesystem, chown)
#endif
#ifdef SYS_fchown
SANDTEST_DENY(Filesystem, fchown)
#endif
#ifdef SYS_lchown
SANDTEST_DENY(Filesystem, lchown)
#endif
#ifdef SYS_fchownat
SANDTEST_DENY(Filesystem, fchownat)
#endif
#ifdef SYS_truncate
SANDTEST_DENY(Filesystem, truncate)
#endif
#ifdef SYS_chdir
SANDTEST_DENY(Filesystem, chdir)
#endif
#ifdef SYS_fchdir
SANDTEST_DENY(Filesystem, fchdir)
#endif
#ifdef SYS_chroot
SANDTEST_DENY(Filesystem, chroot)
#endif
#ifdef SYS_mount
SANDTEST_DENY(Filesystem, mount)
#endif
#ifdef SYS_umount2
SANDTEST_DENY(Filesystem, umount2)
#endif
#ifdef SYS_mknod
SANDTEST_DENY(Filesystem, mknod)
#endif
#ifdef SYS_mknodat
SANDTEST_DENY(Filesystem, mknodat)
#endif
#ifdef SYS_name_to_handle_at
SANDTEST_DENY(Filesystem, name_to_handle_at)
#endif
#ifdef SYS_open_by_handle_at
SANDTEST_DENY(Filesystem, open_by_handle_at)
#endif

// Network
#ifdef SYS_socket
SANDTEST_DENY(Network, socket)
#endif
#ifdef SYS_socketpair
SANDTEST_DENY(Network, socketpair)
#endif
#ifdef SYS_connect
SANDTEST_DENY(Network, connect)
#endif
#ifdef SYS_bind
SANDTEST_DENY(Network, bind)
#endif
#ifdef SYS_listen
SANDTEST_DENY(Network, listen)
#endif
#ifdef SYS_accept
SANDTEST_DENY(Network, accept)
#endif
#ifdef SYS_accept4
SANDTEST_DENY(Network, accept4)
#endif

// Escape
#ifdef SYS_ptrace
SANDTEST_DENY(Escape, ptrace)
#endif
#ifdef SYS_process_vm_readv
SANDTEST_DENY(Escape, process_vm_readv)
#endif
#ifdef SYS_process_vm_writev
SANDTEST_DENY(Escape, process_vm_writev)
#endif
#ifdef SYS_setuid
SANDTEST_DENY(Escape, setuid)
#endif
#ifdef SYS_setgid
SANDTEST_DENY(Escape, setgid)
#endif
#ifdef SYS_setreuid
SANDTEST_DENY(Escape, setreuid)
#endif
#ifdef SYS_setregid
SANDTEST_DENY(Escape, setregid)
#endif
#ifdef SYS_setresuid
SANDTEST_DENY(Escape, setresuid)
#endif
#ifdef SYS_setresgid
SANDTEST_DENY(Escape, setresgid)
#endif
#ifdef SYS_setfsuid
SANDTEST_DENY(Escape, setfsuid)
#endif
#ifdef SYS_setfsgid
SANDTEST_DENY(Escape, setfsgid)
#endif
#ifdef SYS_setgroups
SANDTEST_DENY(Escape, setgroups)
#endif
#ifdef SYS_prctl
SANDTEST_DENY(Escape, prctl)
#endif
#ifdef SYS_seccomp
SANDTEST_DENY(Escape, seccomp)
#endif
#ifdef SYS_bpf
SANDTEST_DENY(Escape, bpf)
#endif
#ifdef SYS_personality
SANDTEST_DENY(Escape, personality)
#endif
#ifdef SYS_pidfd_getfd
SANDTEST_DENY(Escape, pidfd_getfd)
#endif
// io_uring operations are carried out by the kernel without syscall-entry stops
#ifdef SYS_io_uring_setup
SANDTEST_DENY(Escape, io_uring_setup)
#endif
#ifdef SYS_io_uring_enter
SANDTEST_DENY(Escape, io_uring_enter)
#endif
#ifdef SYS_io_uring_register
SANDTEST_DENY(Escape, io_uring_register)
#endif

// NOLINTEND(bugprone-macro-parentheses)
