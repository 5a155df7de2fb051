//
// UmlRenderCache
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include "HtmlFragmentPresenter.h"

#include <QMutexLocker>
#include <QRegularExpression>

namespace {

QString stripXmlProlog(const QString& svg)
{
    static const QRegularExpression prolog(QStringLiteral("^\\s*<\\?xml[^>]*\\?>\\s*"));
    QString result = svg;
    result.remove(prolog);
    return result;
}

} // namespace

void HtmlFragmentPresenter::presentAscii(const QString& text)
{
    setHtml(QStringLiteral("<pre class=\"urc-ascii\">%1</pre>").arg(text.toHtmlEscaped()));
}

void HtmlFragmentPresenter::presentSvg(const QString& svg)
{
    setHtml(QStringLiteral("<div class=\"urc-svg\">%1</div>").arg(stripXmlProlog(svg)));
}

void HtmlFragmentPresenter::presentImageWithMap(const QString& imageBase64, const QString& mapHtml, const QString& key)
{
    const QString trimmedMap = mapHtml.trimmed();
    QString html = QStringLiteral("<img class=\"urc-png\" src=\"data:image/png;base64,%1\"").arg(imageBase64);
    if (!trimmedMap.isEmpty()) {
        html += QStringLiteral(" usemap=\"#%1\">").arg(key);
        html += renameImageMap(trimmedMap, key);
    } else {
        html += QStringLiteral(">");
    }
    setHtml(html);
}

QString HtmlFragmentPresenter::html() const
{
    QMutexLocker locker(&m_mutex);
    return m_html;
}

bool HtmlFragmentPresenter::hasContent() const
{
    QMutexLocker locker(&m_mutex);
    return !m_html.isEmpty();
}

QString HtmlFragmentPresenter::renameImageMap(const QString& mapHtml, const QString& name)
{
    static const QRegularExpression mapTag(QStringLiteral("<map\\b[^>]*>"),
                                           QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression idAttr(QStringLiteral("\\bid\\s*=\\s*\"[^\"]*\""),
                                           QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression nameAttr(QStringLiteral("\\bname\\s*=\\s*\"[^\"]*\""),
                                             QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch match = mapTag.match(mapHtml);
    if (!match.hasMatch()) {
        return mapHtml;
    }

    QString tag = match.captured(0);
    const QString idValue = QStringLiteral("id=\"%1\"").arg(name);
    const QString nameValue = QStringLiteral("name=\"%1\"").arg(name);

    if (tag.contains(idAttr)) {
        tag.replace(idAttr, idValue);
    } else {
        tag.insert(4, QLatin1Char(' ') + idValue);
    }
    if (tag.contains(nameAttr)) {
        tag.replace(nameAttr, nameValue);
    } else {
        tag.insert(4, QLatin1Char(' ') + nameValue);
    }

    QString result = mapHtml;
    result.replace(match.capturedStart(0), match.capturedLength(0), tag);
    return result;
}

void HtmlFragmentPresenter::setHtml(const QString& html)
{
    QMutexLocker locker(&m_mutex);
    m_html = html;
}
