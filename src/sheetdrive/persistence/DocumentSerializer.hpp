#pragma once

#include "sheetdrive/core/Document.hpp"
#include "sheetdrive/core/Expected.hpp"
#include <string>
#include <string_view>

namespace sheetdrive {
namespace persistence {

/**
 * @brief 文档与XML记录之间的转换
 *
 * 记录格式：
 * @code
 * <document id="..." name="..." createdAt="..." updatedAt="..." userId="1">
 *   <data activeSheet="sheet1">
 *     <sheet id="sheet1" name="Sheet1">
 *       <cells>
 *         <cell ref="A1" value="5"/>
 *         <cell ref="A2" formula="=SUM(A1:A1)" cachedValue="5" cachedType="number"/>
 *       </cells>
 *       <columns><entry key="A" value="120"/></columns>
 *       <rows/>
 *     </sheet>
 *   </data>
 * </document>
 * @endcode
 *
 * 所有用户文本都放在属性里，制表符与换行写成字符引用，读回后逐字节一致。
 */
class DocumentSerializer {
public:
    /**
     * @brief 以文档当前元数据序列化
     */
    static std::string serialize(const core::Document& document);

    /**
     * @brief 以指定元数据序列化（保存时元数据在写入成功后才提交到文档）
     */
    static std::string serialize(const core::Document& document, const core::DocumentMetadata& metadata);

    /**
     * @brief 解析记录
     *
     * 缓存结果按原样读入，调用方负责重算。
     * @return 结构缺失或XML损坏时返回 FileCorrupted
     */
    static core::Result<core::Document> deserialize(std::string_view xml);
};

}} // namespace sheetdrive::persistence
