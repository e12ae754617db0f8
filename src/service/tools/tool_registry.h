#ifndef TOOL_REGISTRY_H
#define TOOL_REGISTRY_H

#include "mcp_json.h"

#include <QString>
#include <QVector>
#include <functional>

// 工具注册表：集中维护 tool 名称、描述、输入 schema 与处理函数
// 注册在启动阶段完成，之后只读，可被多个工作线程同时调用
class ToolRegistry
{
  public:
    using Handler = std::function<mcp::json(const mcp::json &arguments)>;

    struct Entry
    {
        QString name;
        QString description;
        mcp::json inputSchema;
        Handler handler;
    };

    // 名称重复时返回 false 且不覆盖原有条目
    bool add(Entry entry);

    const QVector<Entry> &entries() const { return entries_; }
    const Entry *find(const QString &name) const;
    int size() const { return entries_.size(); }

    // tools/list 结果：{"tools":[{name, description, inputSchema}...]}，保持注册顺序
    mcp::json listTools() const;

    // 执行工具并包装为 CallToolResult；工具不存在时抛出 tool_argument_exception(ToolUnknown)
    mcp::json call(const QString &name, const mcp::json &arguments) const;

    static mcp::json textResult(const mcp::json &payload);

  private:
    QVector<Entry> entries_;
};

#endif // TOOL_REGISTRY_H
